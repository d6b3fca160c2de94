#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "planid/core/id.hpp"
#include "planid/core/result.hpp"

namespace planid::core {

class EntropySource {
 public:
  virtual ~EntropySource() = default;

  // Uniform index in [0, bound).
  virtual std::size_t next_index(std::size_t bound) = 0;
};

class RandomEntropySource final : public EntropySource {
 public:
  RandomEntropySource();
  explicit RandomEntropySource(std::uint32_t seed);

  std::size_t next_index(std::size_t bound) override;

 private:
  std::mt19937 engine_;
};

using Clock = std::chrono::system_clock;

// Session IDs carry the UTC creation time at second resolution.
SessionId format_session_id();
SessionId format_session_id(Clock::time_point now, EntropySource& entropy);

Result<GoalId> format_goal_id(const SessionId& session, Sequence sequence);
Result<PlanId> format_plan_id(Sequence goal_sequence, Sequence plan_index_in_goal);
Result<CommandId> format_command_id(const PlanId& plan, Sequence command_sequence);

[[nodiscard]] bool is_canonical(std::string_view candidate, EntityKind kind);
[[nodiscard]] std::optional<EntityKind> entity_kind_of(std::string_view candidate);

Result<SessionId> parse_session_id(std::string_view text);
Result<GoalId> parse_goal_id(std::string_view text);
Result<PlanId> parse_plan_id(std::string_view text);
Result<CommandId> parse_command_id(std::string_view text);

}  // namespace planid::core
