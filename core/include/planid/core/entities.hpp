#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "planid/core/id.hpp"

namespace planid::core {

// Planner-side records. Every field is untrusted upstream input.
struct RawPlan {
  std::string raw_id{};
  std::string action_type{};
  std::string description{};
  std::vector<std::string> depends_on{};
};

struct RawGoal {
  std::string raw_id{};
  std::string label{};
  std::vector<RawPlan> plans{};
};

struct RawGoalPlanTree {
  std::vector<RawGoal> goals{};
  std::string talk_to_player{};
};

struct DependencyEdge {
  std::string raw_reference{};
  std::string target_id{};
  EntityKind target_kind = EntityKind::kPlan;
};

struct NormalizedPlan {
  PlanId id{};
  std::string raw_id{};
  std::string action_type{};
  std::string description{};
  std::vector<DependencyEdge> depends_on{};
};

struct NormalizedGoal {
  GoalId id{};
  std::string raw_id{};
  std::string label{};
  std::vector<NormalizedPlan> plans{};
};

struct NormalizedTree {
  SessionId session{};
  std::vector<NormalizedGoal> goals{};
  std::string talk_to_player{};

  [[nodiscard]] bool empty() const { return goals.empty(); }
  [[nodiscard]] std::size_t plan_count() const {
    std::size_t count = 0;
    for (const NormalizedGoal& goal : goals) {
      count += goal.plans.size();
    }
    return count;
  }
  [[nodiscard]] const NormalizedPlan* find_plan(const std::string& plan_text) const {
    for (const NormalizedGoal& goal : goals) {
      for (const NormalizedPlan& plan : goal.plans) {
        if (plan.id.text == plan_text) {
          return &plan;
        }
      }
    }
    return nullptr;
  }
};

enum class CommandStatus : std::uint8_t {
  kPending = 0,
  kSucceeded = 1,
  kFailed = 2,
};

// Execution-side record of one issued command.
struct CommandRecord {
  CommandId id{};
  std::string action_type{};
  CommandStatus status = CommandStatus::kPending;
  std::optional<CommandId> attempt_of{};
};

inline const char* to_string(CommandStatus status) {
  switch (status) {
  case CommandStatus::kPending:
    return "pending";
  case CommandStatus::kSucceeded:
    return "succeeded";
  case CommandStatus::kFailed:
    return "failed";
  }
  return "unknown";
}

}  // namespace planid::core
