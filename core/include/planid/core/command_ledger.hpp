#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "planid/core/command_counter_registry.hpp"
#include "planid/core/entities.hpp"
#include "planid/core/id.hpp"
#include "planid/core/record_store.hpp"
#include "planid/core/result.hpp"

namespace planid::core {

struct ApprovedPlan {
  PlanId id{};
  GoalId goal{};
  std::string action_type{};
  std::string description{};
};

// Execution-side bookkeeping for one session: which plans the player approved,
// which commands were issued under them and how retries chain together.
//
// Command ids always come from the registry; the ledger never formats one
// itself.
class CommandLedger {
 public:
  explicit CommandLedger(CommandCounterRegistry& registry);

  CommandLedger(const CommandLedger&) = delete;
  CommandLedger& operator=(const CommandLedger&) = delete;

  // Registers the approved subset of a normalized tree. An empty list approves
  // every plan. Unknown plan ids fail with kUnknownPlan and register nothing.
  Result<std::size_t> RegisterApprovedPlans(const NormalizedTree& tree,
                                            const std::vector<std::string>& approved_plan_ids = {});

  Result<CommandRecord> Issue(const PlanId& plan, std::string_view action_type);

  // Issues a fresh command under the same plan, linked to the retried one.
  Result<CommandRecord> Retry(const CommandId& failed_command);

  Result<CommandStatus> Mark(const CommandId& command, CommandStatus status);

  [[nodiscard]] std::optional<CommandRecord> find(std::string_view command_text) const;
  [[nodiscard]] std::optional<ApprovedPlan> plan_for_command(std::string_view command_text) const;
  [[nodiscard]] std::vector<CommandRecord> commands_for_plan(const PlanId& plan) const;
  [[nodiscard]] bool is_approved(const PlanId& plan) const;
  [[nodiscard]] std::size_t command_count() const;

 private:
  Result<CommandRecord> issue_record(const PlanId& plan, std::string_view action_type,
                                     std::optional<CommandId> attempt_of);

  CommandCounterRegistry& registry_;
  mutable std::mutex records_mutex_;
  RecordStore<ApprovedPlan> approved_;
  RecordStore<CommandRecord> commands_;
};

}  // namespace planid::core
