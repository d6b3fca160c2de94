#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "planid/core/entities.hpp"
#include "planid/core/result.hpp"

namespace planid::core {

enum class PayloadStyle : std::uint8_t {
  kJson = 0,
  kYaml = 1,
};

// Decodes the planning service's JSON response into a raw tree. Two shapes are
// accepted:
//   {"goals": [{"id", "label", "plans": [...]}], "talk_to_player"}
//   {"goal_id", "goal_label", "talk_to_player", "plan": [...]}
// where each plan is {"id", "action_type", "description", "depends_on"}.
// Scalar ids of any type are kept as their literal text; depends_on may be a
// single scalar or a list. A single-goal response with no plan steps is a pure
// chat turn and decodes to a tree with no goals.
Result<RawGoalPlanTree> decode_planner_payload(std::string_view text);

// kJson is strict JSON; kYaml is block YAML for people reading a terminal.
std::string encode_normalized_tree(const NormalizedTree& tree, PayloadStyle style = PayloadStyle::kJson);

}  // namespace planid::core
