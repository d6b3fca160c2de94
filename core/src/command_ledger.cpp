#include "planid/core/command_ledger.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "planid/core/log.hpp"

namespace planid::core {

CommandLedger::CommandLedger(CommandCounterRegistry& registry) : registry_(registry) {}

Result<std::size_t> CommandLedger::RegisterApprovedPlans(const NormalizedTree& tree,
                                                         const std::vector<std::string>& approved_plan_ids) {
  std::unordered_set<std::string> wanted(approved_plan_ids.begin(), approved_plan_ids.end());
  for (const std::string& plan_text : wanted) {
    if (tree.find_plan(plan_text) == nullptr) {
      return make_error<std::size_t>(ErrorCode::kUnknownPlan,
                                     "plan '" + plan_text + "' is not part of the normalized tree");
    }
  }

  std::size_t registered = 0;
  std::lock_guard<std::mutex> lock(records_mutex_);
  for (const NormalizedGoal& goal : tree.goals) {
    for (const NormalizedPlan& plan : goal.plans) {
      if (!wanted.empty() && !wanted.contains(plan.id.text)) {
        continue;
      }
      if (approved_.insert(ApprovedPlan{plan.id, goal.id, plan.action_type, plan.description})) {
        ++registered;
      }
    }
  }
  log::get()->info("approved {} plans for {}", registered, tree.session.text);
  return make_ok(registered);
}

Result<CommandRecord> CommandLedger::Issue(const PlanId& plan, std::string_view action_type) {
  return issue_record(plan, action_type, std::nullopt);
}

Result<CommandRecord> CommandLedger::Retry(const CommandId& failed_command) {
  std::optional<CommandRecord> previous = find(failed_command.text);
  if (!previous) {
    return make_error<CommandRecord>(ErrorCode::kUnknownCommand,
                                     "command '" + failed_command.text + "' was never issued");
  }
  return issue_record(previous->id.plan, previous->action_type, previous->id);
}

Result<CommandStatus> CommandLedger::Mark(const CommandId& command, CommandStatus status) {
  std::lock_guard<std::mutex> lock(records_mutex_);
  CommandRecord* record = commands_.find(command.text);
  if (record == nullptr) {
    return make_error<CommandStatus>(ErrorCode::kUnknownCommand, "command '" + command.text + "' was never issued");
  }
  record->status = status;
  return make_ok(status);
}

std::optional<CommandRecord> CommandLedger::find(std::string_view command_text) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  const CommandRecord* record = commands_.find(command_text);
  if (record == nullptr) {
    return std::nullopt;
  }
  return *record;
}

std::optional<ApprovedPlan> CommandLedger::plan_for_command(std::string_view command_text) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  const CommandRecord* record = commands_.find(command_text);
  if (record == nullptr) {
    return std::nullopt;
  }
  const ApprovedPlan* plan = approved_.find(record->id.plan.text);
  if (plan == nullptr) {
    return std::nullopt;
  }
  return *plan;
}

std::vector<CommandRecord> CommandLedger::commands_for_plan(const PlanId& plan) const {
  std::vector<CommandRecord> out;
  std::lock_guard<std::mutex> lock(records_mutex_);
  for (const CommandRecord& record : commands_.items()) {
    if (record.id.plan.text == plan.text) {
      out.push_back(record);
    }
  }
  return out;
}

bool CommandLedger::is_approved(const PlanId& plan) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  return approved_.contains(plan.text);
}

std::size_t CommandLedger::command_count() const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  return commands_.size();
}

Result<CommandRecord> CommandLedger::issue_record(const PlanId& plan, std::string_view action_type,
                                                  std::optional<CommandId> attempt_of) {
  if (!is_approved(plan)) {
    return make_error<CommandRecord>(ErrorCode::kUnknownPlan, "plan '" + plan.text + "' was not approved");
  }

  // Issuance runs outside the ledger lock; the registry serializes per plan.
  auto command = registry_.NextCommandId(plan);
  if (!command.ok) {
    return make_error<CommandRecord>(command.code, command.error);
  }

  CommandRecord record;
  record.id = std::move(command.value);
  record.action_type = std::string(action_type);
  record.attempt_of = std::move(attempt_of);
  bool inserted = false;
  {
    std::lock_guard<std::mutex> lock(records_mutex_);
    inserted = commands_.insert(record);
  }
  if (!inserted) {
    log::get()->error("registry handed out {} twice", record.id.text);
    return make_error<CommandRecord>(ErrorCode::kInvalidSequence, "command '" + record.id.text + "' already issued");
  }
  if (record.attempt_of) {
    log::get()->info("issued {} as retry of {}", record.id.text, record.attempt_of->text);
  } else {
    log::get()->debug("issued {} ({})", record.id.text, record.action_type);
  }
  return make_ok(std::move(record));
}

}  // namespace planid::core
