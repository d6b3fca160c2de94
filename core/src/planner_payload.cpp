#include "planid/core/planner_payload.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace planid::core {

namespace {

using json = nlohmann::json;

// Numbers and booleans keep their literal JSON text ("1", not 1.0).
bool scalar_text(const json& node, const std::string& where, std::string* out, std::string* error) {
  if (node.is_null()) {
    out->clear();
    return true;
  }
  if (node.is_string()) {
    *out = node.get<std::string>();
    return true;
  }
  if (node.is_number() || node.is_boolean()) {
    *out = node.dump();
    return true;
  }
  *error = where + " must be a scalar";
  return false;
}

bool scalar_field(const json& parent, const char* key, const std::string& where, std::string* out,
                  std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    out->clear();
    return true;
  }
  return scalar_text(*it, where + "." + key, out, error);
}

bool reference_list(const json& parent, const std::string& where, std::vector<std::string>* out,
                    std::string* error) {
  auto it = parent.find("depends_on");
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_array()) {
    std::string reference;
    if (!scalar_text(*it, where + ".depends_on", &reference, error)) {
      *error = where + ".depends_on must be a scalar or a list";
      return false;
    }
    out->push_back(std::move(reference));
    return true;
  }
  for (std::size_t i = 0; i < it->size(); ++i) {
    std::string reference;
    if (!scalar_text((*it)[i], where + ".depends_on[" + std::to_string(i) + "]", &reference, error)) {
      return false;
    }
    out->push_back(std::move(reference));
  }
  return true;
}

bool decode_plans(const json& parent, const char* key, const std::string& where, std::vector<RawPlan>* out,
                  std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_array()) {
    *error = where + " must be a list";
    return false;
  }
  out->reserve(it->size());
  for (std::size_t i = 0; i < it->size(); ++i) {
    const json& node = (*it)[i];
    const std::string at = where + "[" + std::to_string(i) + "]";
    if (!node.is_object()) {
      *error = at + " must be an object";
      return false;
    }
    RawPlan plan;
    if (!scalar_field(node, "id", at, &plan.raw_id, error) ||
        !scalar_field(node, "action_type", at, &plan.action_type, error) ||
        !scalar_field(node, "description", at, &plan.description, error) ||
        !reference_list(node, at, &plan.depends_on, error)) {
      return false;
    }
    out->push_back(std::move(plan));
  }
  return true;
}

bool decode_tree(const json& root, RawGoalPlanTree* tree, std::string* error) {
  if (!root.is_object()) {
    *error = "payload must be an object";
    return false;
  }
  if (!scalar_field(root, "talk_to_player", "payload", &tree->talk_to_player, error)) {
    return false;
  }

  auto goals = root.find("goals");
  if (goals != root.end() && !goals->is_null()) {
    if (!goals->is_array()) {
      *error = "payload.goals must be a list";
      return false;
    }
    for (std::size_t i = 0; i < goals->size(); ++i) {
      const json& node = (*goals)[i];
      const std::string at = "payload.goals[" + std::to_string(i) + "]";
      if (!node.is_object()) {
        *error = at + " must be an object";
        return false;
      }
      RawGoal goal;
      if (!scalar_field(node, "id", at, &goal.raw_id, error) ||
          !scalar_field(node, "label", at, &goal.label, error) ||
          !decode_plans(node, "plans", at + ".plans", &goal.plans, error)) {
        return false;
      }
      tree->goals.push_back(std::move(goal));
    }
    return true;
  }

  RawGoal goal;
  if (!decode_plans(root, "plan", "payload.plan", &goal.plans, error) ||
      !scalar_field(root, "goal_id", "payload", &goal.raw_id, error) ||
      !scalar_field(root, "goal_label", "payload", &goal.label, error)) {
    return false;
  }
  if (!goal.plans.empty()) {
    tree->goals.push_back(std::move(goal));
  }
  return true;
}

json to_json(const NormalizedTree& tree) {
  json goals = json::array();
  for (const NormalizedGoal& goal : tree.goals) {
    json plans = json::array();
    for (const NormalizedPlan& plan : goal.plans) {
      json depends_on = json::array();
      for (const DependencyEdge& edge : plan.depends_on) {
        depends_on.push_back(edge.target_id);
      }
      plans.push_back(json::object({
          {"plan_id", plan.id.text},
          {"raw_id", plan.raw_id},
          {"action_type", plan.action_type},
          {"description", plan.description},
          {"depends_on", std::move(depends_on)},
      }));
    }
    goals.push_back(json::object({
        {"goal_id", goal.id.text},
        {"raw_id", goal.raw_id},
        {"label", goal.label},
        {"plans", std::move(plans)},
    }));
  }
  return json::object({
      {"session_id", tree.session.text},
      {"talk_to_player", tree.talk_to_player},
      {"goals", std::move(goals)},
  });
}

std::string to_yaml(const NormalizedTree& tree) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "session_id" << YAML::Value << tree.session.text;
  out << YAML::Key << "talk_to_player" << YAML::Value << tree.talk_to_player;
  out << YAML::Key << "goals" << YAML::Value << YAML::BeginSeq;
  for (const NormalizedGoal& goal : tree.goals) {
    out << YAML::BeginMap;
    out << YAML::Key << "goal_id" << YAML::Value << goal.id.text;
    out << YAML::Key << "raw_id" << YAML::Value << goal.raw_id;
    out << YAML::Key << "label" << YAML::Value << goal.label;
    out << YAML::Key << "plans" << YAML::Value << YAML::BeginSeq;
    for (const NormalizedPlan& plan : goal.plans) {
      out << YAML::BeginMap;
      out << YAML::Key << "plan_id" << YAML::Value << plan.id.text;
      out << YAML::Key << "raw_id" << YAML::Value << plan.raw_id;
      out << YAML::Key << "action_type" << YAML::Value << plan.action_type;
      out << YAML::Key << "description" << YAML::Value << plan.description;
      out << YAML::Key << "depends_on" << YAML::Value << YAML::Flow << YAML::BeginSeq;
      for (const DependencyEdge& edge : plan.depends_on) {
        out << edge.target_id;
      }
      out << YAML::EndSeq;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace

Result<RawGoalPlanTree> decode_planner_payload(std::string_view text) {
  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    return make_error<RawGoalPlanTree>(ErrorCode::kMalformedPayload, std::string("payload does not parse: ") + e.what());
  }

  RawGoalPlanTree tree;
  std::string error;
  if (!decode_tree(root, &tree, &error)) {
    return make_error<RawGoalPlanTree>(ErrorCode::kMalformedPayload, error);
  }
  return make_ok(std::move(tree));
}

std::string encode_normalized_tree(const NormalizedTree& tree, PayloadStyle style) {
  if (style == PayloadStyle::kYaml) {
    return to_yaml(tree);
  }
  // Invalid UTF-8 from non-JSON callers is replaced instead of throwing.
  return to_json(tree).dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace planid::core
