#include "planid/core/id_format.hpp"

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace planid::core {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_suffix_char(char c) { return (c >= 'a' && c <= 'z') || is_digit(c); }

Sequence to_sequence(std::string_view digits) {
  Sequence value = 0;
  for (char c : digits) {
    value = value * 10 + static_cast<Sequence>(c - '0');
  }
  return value;
}

// Left-to-right matcher over the fixed field layout of an identifier.
class FieldCursor {
 public:
  explicit FieldCursor(std::string_view text) : text_(text) {}

  bool literal(std::string_view expected) {
    if (text_.substr(pos_, expected.size()) != expected) {
      return false;
    }
    pos_ += expected.size();
    return true;
  }

  bool separator() {
    if (pos_ >= text_.size() || text_[pos_] != kFieldSeparator) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool digits(int width, std::string_view* out) { return field(width, is_digit, out); }

  bool suffix(int width, std::string_view* out) { return field(width, is_suffix_char, out); }

  [[nodiscard]] bool at_end() const { return pos_ == text_.size(); }
  [[nodiscard]] std::size_t position() const { return pos_; }
  [[nodiscard]] std::string_view consumed_since(std::size_t start) const { return text_.substr(start, pos_ - start); }

 private:
  bool field(int width, bool (*accept)(char), std::string_view* out) {
    const auto count = static_cast<std::size_t>(width);
    if (text_.size() - pos_ < count) {
      return false;
    }
    for (std::size_t i = 0; i < count; ++i) {
      if (!accept(text_[pos_ + i])) {
        return false;
      }
    }
    *out = text_.substr(pos_, count);
    pos_ += count;
    return true;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

bool in_range(std::string_view digits, Sequence lo, Sequence hi) {
  const Sequence value = to_sequence(digits);
  return value >= lo && value <= hi;
}

bool scan_session(FieldCursor& cursor, SessionId* out) {
  std::string_view date;
  std::string_view time;
  std::string_view suffix;
  const std::size_t start = cursor.position();
  if (!cursor.literal(kSessionPrefix) || !cursor.separator() || !cursor.digits(kSessionDateWidth, &date) ||
      !cursor.separator() || !cursor.digits(kSessionTimeWidth, &time) || !cursor.separator() ||
      !cursor.suffix(kSessionSuffixWidth, &suffix)) {
    return false;
  }
  // YYYYMMDD / HHMMSS must name a plausible calendar instant.
  if (!in_range(date.substr(4, 2), 1, 12) || !in_range(date.substr(6, 2), 1, 31) ||
      !in_range(time.substr(0, 2), 0, 23) || !in_range(time.substr(2, 2), 0, 59) ||
      !in_range(time.substr(4, 2), 0, 59)) {
    return false;
  }
  out->text = std::string(cursor.consumed_since(start));
  out->suffix = std::string(suffix);
  return true;
}

bool scan_goal(FieldCursor& cursor, GoalId* out) {
  std::string_view suffix;
  std::string_view sequence;
  const std::size_t start = cursor.position();
  if (!cursor.literal(kGoalPrefix) || !cursor.separator() || !cursor.suffix(kSessionSuffixWidth, &suffix) ||
      !cursor.separator() || !cursor.digits(kGoalSequenceWidth, &sequence)) {
    return false;
  }
  if (to_sequence(sequence) == kInvalidSequence) {
    return false;
  }
  out->text = std::string(cursor.consumed_since(start));
  out->session_suffix = std::string(suffix);
  out->sequence = to_sequence(sequence);
  return true;
}

bool scan_plan(FieldCursor& cursor, PlanId* out) {
  std::string_view goal_sequence;
  std::string_view plan_sequence;
  const std::size_t start = cursor.position();
  if (!cursor.literal(kPlanPrefix) || !cursor.separator() || !cursor.digits(kGoalSequenceWidth, &goal_sequence) ||
      !cursor.separator() || !cursor.digits(kPlanSequenceWidth, &plan_sequence)) {
    return false;
  }
  if (to_sequence(goal_sequence) == kInvalidSequence || to_sequence(plan_sequence) == kInvalidSequence) {
    return false;
  }
  out->text = std::string(cursor.consumed_since(start));
  out->goal_sequence = to_sequence(goal_sequence);
  out->plan_sequence = to_sequence(plan_sequence);
  return true;
}

bool scan_command(FieldCursor& cursor, CommandId* out) {
  std::string_view sequence;
  const std::size_t start = cursor.position();
  if (!cursor.literal(kCommandPrefix) || !cursor.separator() || !scan_plan(cursor, &out->plan) ||
      !cursor.separator() || !cursor.digits(kCommandSequenceWidth, &sequence)) {
    return false;
  }
  if (to_sequence(sequence) == kInvalidSequence) {
    return false;
  }
  out->text = std::string(cursor.consumed_since(start));
  out->sequence = to_sequence(sequence);
  return true;
}

template <typename TId>
Result<TId> parse_whole(std::string_view text, EntityKind kind, bool (*scan)(FieldCursor&, TId*)) {
  FieldCursor cursor(text);
  TId id{};
  if (!scan(cursor, &id) || !cursor.at_end()) {
    const ErrorCode code =
        kind == EntityKind::kSession ? ErrorCode::kInvalidSessionFormat : ErrorCode::kInvalidSequence;
    return make_error<TId>(code, std::string("not a canonical ") + to_string(kind) + " id: '" +
                                     std::string(text) + "'");
  }
  return make_ok(std::move(id));
}

Result<Sequence> check_sequence(std::string_view field, Sequence value, Sequence max_value) {
  if (value == kInvalidSequence) {
    return make_error<Sequence>(ErrorCode::kInvalidSequence, std::string(field) + " must be >= 1");
  }
  if (value > max_value) {
    return make_error<Sequence>(ErrorCode::kInvalidSequence,
                                std::string(field) + " " + std::to_string(value) + " exceeds " +
                                    std::to_string(max_value));
  }
  return make_ok(value);
}

}  // namespace

RandomEntropySource::RandomEntropySource() : engine_(std::random_device{}()) {}

RandomEntropySource::RandomEntropySource(std::uint32_t seed) : engine_(seed) {}

std::size_t RandomEntropySource::next_index(std::size_t bound) {
  std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
  return dist(engine_);
}

SessionId format_session_id() {
  thread_local RandomEntropySource entropy;
  return format_session_id(Clock::now(), entropy);
}

SessionId format_session_id(Clock::time_point now, EntropySource& entropy) {
  using namespace std::chrono;
  const auto secs = floor<seconds>(now);
  const auto today = floor<days>(secs);
  const year_month_day ymd{today};
  const hh_mm_ss<seconds> hms{secs - today};

  SessionId session{};
  for (int i = 0; i < kSessionSuffixWidth; ++i) {
    session.suffix.push_back(kSessionSuffixAlphabet[entropy.next_index(kSessionSuffixAlphabet.size())]);
  }

  std::ostringstream oss;
  oss << kSessionPrefix << kFieldSeparator << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year())
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << std::setw(2) << static_cast<unsigned>(ymd.day())
      << kFieldSeparator << std::setw(2) << hms.hours().count() << std::setw(2) << hms.minutes().count()
      << std::setw(2) << hms.seconds().count() << kFieldSeparator << session.suffix;
  session.text = oss.str();
  return session;
}

Result<GoalId> format_goal_id(const SessionId& session, Sequence sequence) {
  const auto checked = check_sequence("goal sequence", sequence, kMaxGoalSequence);
  if (!checked.ok) {
    return make_error<GoalId>(checked.code, checked.error);
  }
  std::string_view ignored;
  FieldCursor suffix_cursor(session.suffix);
  if (!suffix_cursor.suffix(kSessionSuffixWidth, &ignored) || !suffix_cursor.at_end()) {
    return make_error<GoalId>(ErrorCode::kInvalidSessionFormat,
                              "session '" + session.text + "' has no canonical suffix");
  }

  GoalId goal{};
  goal.session_suffix = session.suffix;
  goal.sequence = sequence;
  goal.text = std::string(kGoalPrefix) + kFieldSeparator + session.suffix + kFieldSeparator +
              make_padded_field(sequence, kGoalSequenceWidth);
  return make_ok(std::move(goal));
}

Result<PlanId> format_plan_id(Sequence goal_sequence, Sequence plan_index_in_goal) {
  const auto goal_checked = check_sequence("goal sequence", goal_sequence, kMaxGoalSequence);
  if (!goal_checked.ok) {
    return make_error<PlanId>(goal_checked.code, goal_checked.error);
  }
  const auto plan_checked = check_sequence("plan index", plan_index_in_goal, kMaxPlanSequence);
  if (!plan_checked.ok) {
    return make_error<PlanId>(plan_checked.code, plan_checked.error);
  }

  PlanId plan{};
  plan.goal_sequence = goal_sequence;
  plan.plan_sequence = plan_index_in_goal;
  plan.text = std::string(kPlanPrefix) + kFieldSeparator + make_padded_field(goal_sequence, kGoalSequenceWidth) +
              kFieldSeparator + make_padded_field(plan_index_in_goal, kPlanSequenceWidth);
  return make_ok(std::move(plan));
}

Result<CommandId> format_command_id(const PlanId& plan, Sequence command_sequence) {
  const auto checked = check_sequence("command sequence", command_sequence, kMaxCommandSequence);
  if (!checked.ok) {
    return make_error<CommandId>(checked.code, checked.error);
  }
  auto parsed_plan = parse_plan_id(plan.text);
  if (!parsed_plan.ok) {
    return make_error<CommandId>(ErrorCode::kUnknownPlan, parsed_plan.error);
  }

  CommandId command{};
  command.plan = std::move(parsed_plan.value);
  command.sequence = command_sequence;
  command.text = std::string(kCommandPrefix) + kFieldSeparator + command.plan.text + kFieldSeparator +
                 make_padded_field(command_sequence, kCommandSequenceWidth);
  return make_ok(std::move(command));
}

bool is_canonical(std::string_view candidate, EntityKind kind) {
  switch (kind) {
  case EntityKind::kSession:
    return parse_session_id(candidate).ok;
  case EntityKind::kGoal:
    return parse_goal_id(candidate).ok;
  case EntityKind::kPlan:
    return parse_plan_id(candidate).ok;
  case EntityKind::kCommand:
    return parse_command_id(candidate).ok;
  }
  return false;
}

std::optional<EntityKind> entity_kind_of(std::string_view candidate) {
  for (EntityKind kind : {EntityKind::kSession, EntityKind::kGoal, EntityKind::kPlan, EntityKind::kCommand}) {
    if (is_canonical(candidate, kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

Result<SessionId> parse_session_id(std::string_view text) {
  return parse_whole<SessionId>(text, EntityKind::kSession, scan_session);
}

Result<GoalId> parse_goal_id(std::string_view text) {
  return parse_whole<GoalId>(text, EntityKind::kGoal, scan_goal);
}

Result<PlanId> parse_plan_id(std::string_view text) {
  return parse_whole<PlanId>(text, EntityKind::kPlan, scan_plan);
}

Result<CommandId> parse_command_id(std::string_view text) {
  return parse_whole<CommandId>(text, EntityKind::kCommand, scan_command);
}

}  // namespace planid::core
