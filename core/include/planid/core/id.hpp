#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace planid::core {

using Sequence = std::uint32_t;
constexpr Sequence kInvalidSequence = 0;

enum class EntityKind : std::uint8_t {
  kSession = 0,
  kGoal = 1,
  kPlan = 2,
  kCommand = 3,
};

// Field layout of canonical identifiers.
constexpr std::string_view kSessionPrefix = "sess";
constexpr std::string_view kGoalPrefix = "goal";
constexpr std::string_view kPlanPrefix = "plan";
constexpr std::string_view kCommandPrefix = "cmd";
constexpr char kFieldSeparator = '_';

constexpr int kSessionDateWidth = 8;
constexpr int kSessionTimeWidth = 6;
constexpr int kSessionSuffixWidth = 4;
constexpr int kGoalSequenceWidth = 3;
constexpr int kPlanSequenceWidth = 2;
constexpr int kCommandSequenceWidth = 3;

constexpr Sequence kMaxGoalSequence = 999;
constexpr Sequence kMaxPlanSequence = 99;
constexpr Sequence kMaxCommandSequence = 999;

// Minted suffixes avoid 0/o, 1/l/i. Canonical checks accept any [a-z0-9].
constexpr std::string_view kSessionSuffixAlphabet = "abcdefghjkmnpqrstuvwxyz23456789";

struct SessionId {
  std::string text{};
  std::string suffix{};
};

struct GoalId {
  std::string text{};
  std::string session_suffix{};
  Sequence sequence = kInvalidSequence;
};

struct PlanId {
  std::string text{};
  Sequence goal_sequence = kInvalidSequence;
  Sequence plan_sequence = kInvalidSequence;
};

struct CommandId {
  std::string text{};
  PlanId plan{};
  Sequence sequence = kInvalidSequence;
};

inline bool operator==(const SessionId& a, const SessionId& b) { return a.text == b.text; }
inline bool operator==(const GoalId& a, const GoalId& b) { return a.text == b.text; }
inline bool operator==(const PlanId& a, const PlanId& b) { return a.text == b.text; }
inline bool operator==(const CommandId& a, const CommandId& b) { return a.text == b.text; }

class SequenceCounter {
 public:
  explicit SequenceCounter(Sequence next = 1) : next_(next) {}

  [[nodiscard]] Sequence peek() const { return next_; }

  void advance(Sequence count) { next_ += count; }

 private:
  Sequence next_ = 1;
};

inline std::string make_padded_field(Sequence value, int pad_width) {
  std::ostringstream oss;
  oss << std::setw(pad_width) << std::setfill('0') << value;
  return oss.str();
}

inline const char* to_string(EntityKind kind) {
  switch (kind) {
  case EntityKind::kSession:
    return "session";
  case EntityKind::kGoal:
    return "goal";
  case EntityKind::kPlan:
    return "plan";
  case EntityKind::kCommand:
    return "command";
  }
  return "unknown";
}

}  // namespace planid::core
