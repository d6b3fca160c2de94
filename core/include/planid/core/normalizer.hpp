#pragma once

#include <string>

#include "planid/core/entities.hpp"
#include "planid/core/id.hpp"
#include "planid/core/result.hpp"

namespace planid::core {

// Populated when normalization fails with kUnresolvedDependency.
struct UnresolvedDependencyDetail {
  std::string raw_reference{};
  std::string source_plan_raw_id{};
};

struct NormalizeResult : Result<NormalizedTree> {
  UnresolvedDependencyDetail unresolved{};
};

// Canonicalizes one planning call's output against its session.
//
// Goal i (0-based, input order) receives sequence first_goal_sequence + i and
// plan j of a goal receives index j + 1. Raw identifiers are never kept, even
// when they already look canonical. Dependency references are rewritten through
// a raw-to-canonical mapping local to this call; any reference that does not
// resolve rejects the whole call and no tree is returned.
//
// A tree with zero goals is a no-op: ok is true and code is kEmptyTree.
NormalizeResult normalize(const SessionId& session, const RawGoalPlanTree& raw_tree,
                          Sequence first_goal_sequence = 1);

// Two goals: the first with two plans, the second with one plan depending on
// the first goal's second plan.
RawGoalPlanTree make_demo_tree();

}  // namespace planid::core
