#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "coordination_options.hpp"
#include "internal/runtime/periodic_task.hpp"

namespace claims::activity {
class ActivityTracker;
}
namespace claims::service {
class ClaimService;
}

namespace claims::coordination {

struct StealRecord {
  std::string claim_id;
  std::string from_claimant;
  std::string to_claimant;
  bool        cross_domain = false;
};

struct CycleReport {
  bool          skipped     = false; // another cycle was running
  bool          interrupted = false; // deadline or stop request
  std::size_t   idle_claimants   = 0;
  std::size_t   stale_candidates = 0;
  std::size_t   conflicts        = 0;
  std::size_t   failures         = 0;
  std::uint64_t now_ms           = 0;
  std::vector<StealRecord> steals;
};

/*
  WorkStealingCoordinator

  One cycle:
    1. idle claimants from the ActivityTracker, oldest activity first
    2. stale claims, highest priority first, then longest silence, then oldest
    3. every idle claimant takes the first unmatched claim in its domain
       (any domain when cross-domain stealing is allowed and none matches)
    4. ClaimService::Steal; a lost race or any other per-claim failure
       consumes that claim and the claimant moves on to the next candidate

  A claimant receives at most one claim per cycle and a claim is matched at
  most once per cycle. Cycles never overlap.
*/
class WorkStealingCoordinator {
 public:
  WorkStealingCoordinator(std::shared_ptr<service::ClaimService> service, std::shared_ptr<activity::ActivityTracker> tracker,
                          WorkStealingOptions options);
  ~WorkStealingCoordinator();

  void Start();
  void Stop();
  bool IsRunning() const;

  CycleReport RunCycle(const runtime::CycleContext* ctx = nullptr);

  const WorkStealingOptions& Options() const {
    return options_;
  }

 private:
  CycleReport Execute(const runtime::CycleContext* ctx);

  std::shared_ptr<service::ClaimService>     service_;
  std::shared_ptr<activity::ActivityTracker> tracker_;
  WorkStealingOptions                        options_;
  std::atomic<bool>                          in_flight_{false};
  std::unique_ptr<runtime::PeriodicTask>     task_;
};

} // namespace claims::coordination
