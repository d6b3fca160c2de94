#include "planid/core/command_counter_registry.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "planid/core/id_format.hpp"
#include "planid/core/log.hpp"

namespace planid::core {

CommandCounterRegistry::CommandCounterRegistry() = default;

Result<CommandId> CommandCounterRegistry::NextCommandId(const PlanId& plan) {
  auto parsed = parse_plan_id(plan.text);
  if (!parsed.ok) {
    return make_error<CommandId>(ErrorCode::kUnknownPlan, parsed.error);
  }

  for (;;) {
    {
      // The index reader lock is held across the per-plan section so Reset
      // cannot discard a counter while it is being incremented.
      std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
      if (retired_.contains(plan.text)) {
        return make_error<CommandId>(ErrorCode::kRetiredPlan, "plan '" + plan.text + "' has been retired");
      }
      auto it = counters_.find(plan.text);
      if (it != counters_.end()) {
        PlanCounter& counter = *it->second;
        std::lock_guard<std::mutex> counter_lock(counter.mutex);
        auto command = format_command_id(parsed.value, counter.value + 1);
        if (!command.ok) {
          return command;
        }
        ++counter.value;
        log::get()->debug("issued {}", command.value.text);
        return command;
      }
    }

    std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
    if (!retired_.contains(plan.text)) {
      counters_.try_emplace(plan.text, std::make_unique<PlanCounter>());
    }
  }
}

Result<bool> CommandCounterRegistry::Reset(const PlanId& plan) {
  std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
  auto it = counters_.find(plan.text);
  if (it == counters_.end()) {
    return make_error<bool>(ErrorCode::kUnknownPlan, "plan '" + plan.text + "' has no counter");
  }
  const Sequence last = it->second->value;
  counters_.erase(it);
  retired_.insert(plan.text);
  log::get()->info("retired {} after {} commands", plan.text, last);
  return make_ok(true);
}

std::optional<Sequence> CommandCounterRegistry::current(const PlanId& plan) const {
  std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
  auto it = counters_.find(plan.text);
  if (it == counters_.end()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> counter_lock(it->second->mutex);
  return it->second->value;
}

bool CommandCounterRegistry::is_retired(const PlanId& plan) const {
  std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
  return retired_.contains(plan.text);
}

std::size_t CommandCounterRegistry::size() const {
  std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
  return counters_.size();
}

}  // namespace planid::core
