#include "planid/core/normalizer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "planid/core/id_format.hpp"
#include "planid/core/log.hpp"

namespace planid::core {

namespace {

using RawToCanonical = std::unordered_map<std::string, std::string>;

// Lives for one normalize() call only.
struct RawIdMapping {
  RawToCanonical goals{};
  RawToCanonical plans{};
  std::vector<RawToCanonical> plans_by_goal{};
};

NormalizeResult fail(ErrorCode code, std::string message) {
  NormalizeResult result;
  result.code = code;
  result.error = std::move(message);
  return result;
}

NormalizeResult unresolved(const std::string& source_plan_raw_id, const std::string& raw_reference,
                           std::string message) {
  NormalizeResult result = fail(ErrorCode::kUnresolvedDependency, std::move(message));
  result.unresolved.raw_reference = raw_reference;
  result.unresolved.source_plan_raw_id = source_plan_raw_id;
  return result;
}

// First occurrence in input order wins; later duplicates still get their own ids.
bool record_first(RawToCanonical& map, const std::string& raw_id, const std::string& canonical) {
  if (raw_id.empty()) {
    return true;
  }
  return map.emplace(raw_id, canonical).second;
}

std::optional<DependencyEdge> resolve_reference(const RawIdMapping& mapping, std::size_t goal_index,
                                                const std::string& raw_reference) {
  const RawToCanonical& local = mapping.plans_by_goal[goal_index];
  if (auto it = local.find(raw_reference); it != local.end()) {
    return DependencyEdge{raw_reference, it->second, EntityKind::kPlan};
  }
  if (auto it = mapping.plans.find(raw_reference); it != mapping.plans.end()) {
    return DependencyEdge{raw_reference, it->second, EntityKind::kPlan};
  }
  if (auto it = mapping.goals.find(raw_reference); it != mapping.goals.end()) {
    return DependencyEdge{raw_reference, it->second, EntityKind::kGoal};
  }
  return std::nullopt;
}

}  // namespace

NormalizeResult normalize(const SessionId& session, const RawGoalPlanTree& raw_tree, Sequence first_goal_sequence) {
  auto logger = log::get();

  if (!is_canonical(session.text, EntityKind::kSession)) {
    return fail(ErrorCode::kInvalidSessionFormat, "session '" + session.text + "' is not canonical");
  }

  if (raw_tree.goals.empty()) {
    logger->info("planning call for {} proposed no goals", session.text);
    NormalizeResult result;
    result.ok = true;
    result.code = ErrorCode::kEmptyTree;
    result.value.session = session;
    result.value.talk_to_player = raw_tree.talk_to_player;
    return result;
  }

  NormalizedTree tree;
  tree.session = session;
  tree.talk_to_player = raw_tree.talk_to_player;
  tree.goals.reserve(raw_tree.goals.size());

  RawIdMapping mapping;
  mapping.plans_by_goal.resize(raw_tree.goals.size());

  for (std::size_t goal_index = 0; goal_index < raw_tree.goals.size(); ++goal_index) {
    const RawGoal& raw_goal = raw_tree.goals[goal_index];
    const Sequence goal_sequence = first_goal_sequence + static_cast<Sequence>(goal_index);

    auto goal_id = format_goal_id(session, goal_sequence);
    if (!goal_id.ok) {
      return fail(goal_id.code, goal_id.error);
    }

    NormalizedGoal goal;
    goal.id = std::move(goal_id.value);
    goal.raw_id = raw_goal.raw_id;
    goal.label = raw_goal.label;
    if (!record_first(mapping.goals, raw_goal.raw_id, goal.id.text)) {
      logger->warn("duplicate raw goal id '{}' at {}; references resolve to the first occurrence", raw_goal.raw_id,
                   goal.id.text);
    }

    goal.plans.reserve(raw_goal.plans.size());
    for (std::size_t plan_index = 0; plan_index < raw_goal.plans.size(); ++plan_index) {
      const RawPlan& raw_plan = raw_goal.plans[plan_index];
      auto plan_id = format_plan_id(goal_sequence, static_cast<Sequence>(plan_index + 1));
      if (!plan_id.ok) {
        return fail(plan_id.code, plan_id.error);
      }

      NormalizedPlan plan;
      plan.id = std::move(plan_id.value);
      plan.raw_id = raw_plan.raw_id;
      plan.action_type = raw_plan.action_type;
      plan.description = raw_plan.description;
      if (!record_first(mapping.plans_by_goal[goal_index], raw_plan.raw_id, plan.id.text)) {
        logger->warn("duplicate raw plan id '{}' within goal '{}' at {}", raw_plan.raw_id, raw_goal.raw_id,
                     plan.id.text);
      }
      record_first(mapping.plans, raw_plan.raw_id, plan.id.text);
      goal.plans.push_back(std::move(plan));
    }
    tree.goals.push_back(std::move(goal));
  }

  for (std::size_t goal_index = 0; goal_index < raw_tree.goals.size(); ++goal_index) {
    const RawGoal& raw_goal = raw_tree.goals[goal_index];
    NormalizedGoal& goal = tree.goals[goal_index];
    for (std::size_t plan_index = 0; plan_index < raw_goal.plans.size(); ++plan_index) {
      const RawPlan& raw_plan = raw_goal.plans[plan_index];
      NormalizedPlan& plan = goal.plans[plan_index];
      plan.depends_on.reserve(raw_plan.depends_on.size());
      for (const std::string& raw_reference : raw_plan.depends_on) {
        auto edge = resolve_reference(mapping, goal_index, raw_reference);
        if (!edge) {
          logger->warn("rejecting planning call for {}: plan '{}' depends on unresolved '{}'", session.text,
                       raw_plan.raw_id, raw_reference);
          return unresolved(raw_plan.raw_id, raw_reference,
                            "plan '" + raw_plan.raw_id + "' depends on unresolved reference '" + raw_reference + "'");
        }
        // Self-references are rejected like unresolved ones.
        if (edge->target_kind == EntityKind::kPlan && edge->target_id == plan.id.text) {
          logger->warn("rejecting planning call for {}: plan '{}' depends on itself", session.text, raw_plan.raw_id);
          return unresolved(raw_plan.raw_id, raw_reference,
                            "plan '" + raw_plan.raw_id + "' depends on itself via '" + raw_reference + "'");
        }
        plan.depends_on.push_back(std::move(*edge));
      }
    }
  }

  logger->debug("normalized {} goals / {} plans for {}", tree.goals.size(), tree.plan_count(), session.text);
  NormalizeResult result;
  result.ok = true;
  result.value = std::move(tree);
  return result;
}

RawGoalPlanTree make_demo_tree() {
  RawGoalPlanTree tree;
  tree.talk_to_player = "I'll clear the ground, then raise a watchtower on it.";

  RawGoal clear;
  clear.raw_id = "clear_site";
  clear.label = "Clear the building site";
  clear.plans.push_back({"1", "move_to", "Walk to the marked clearing.", {}});
  clear.plans.push_back({"2", "destroy_block", "Remove the grass blocks in a 5x5 square.", {"1"}});

  RawGoal tower;
  tower.raw_id = "build_tower";
  tower.label = "Raise a watchtower";
  tower.plans.push_back({"1", "place_block", "Stack stone blocks four high on the cleared square.", {"2"}});

  tree.goals.push_back(std::move(clear));
  tree.goals.push_back(std::move(tower));
  return tree;
}

}  // namespace planid::core
