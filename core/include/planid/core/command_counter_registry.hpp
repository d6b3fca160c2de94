#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "planid/core/id.hpp"
#include "planid/core/result.hpp"

namespace planid::core {

// Per-plan command sequence numbers for one session's execution lifecycle.
//
// Plan identifiers do not embed the session, so one registry serves exactly
// one session. Counters start at 0 and are created lazily on first use. Calls
// for the same plan are serialized by that plan's own lock; calls for
// different plans only share a reader lock on the index.
class CommandCounterRegistry {
 public:
  CommandCounterRegistry();

  CommandCounterRegistry(const CommandCounterRegistry&) = delete;
  CommandCounterRegistry& operator=(const CommandCounterRegistry&) = delete;

  // Increment-then-format is one step: a sequence that cannot be rendered
  // leaves the counter where it was.
  Result<CommandId> NextCommandId(const PlanId& plan);

  // Discards the counter and retires the plan's namespace. Later
  // NextCommandId calls for the plan fail with kRetiredPlan.
  Result<bool> Reset(const PlanId& plan);

  [[nodiscard]] std::optional<Sequence> current(const PlanId& plan) const;
  [[nodiscard]] bool is_retired(const PlanId& plan) const;
  [[nodiscard]] std::size_t size() const;

 private:
  struct PlanCounter {
    std::mutex mutex;
    Sequence value = 0;
  };

  mutable std::shared_mutex index_mutex_;
  std::unordered_map<std::string, std::unique_ptr<PlanCounter>> counters_;
  std::unordered_set<std::string> retired_;
};

}  // namespace planid::core
