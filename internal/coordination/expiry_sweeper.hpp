#pragma once

#include <atomic>
#include <memory>

#include "coordination_options.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/service/claim_service.hpp"

namespace claims::coordination {

/*
  Background cycle that applies the per-kind expiry policy to stale claims
  through ClaimService::ExpireStale.
*/
class ExpirySweeper {
 public:
  ExpirySweeper(std::shared_ptr<service::ClaimService> service, ExpiryOptions options);
  ~ExpirySweeper();

  void Start();
  void Stop();
  bool IsRunning() const;

  // Single-flight; a call made while another sweep runs returns a skipped report.
  service::ExpirySweepReport SweepOnce(const runtime::CycleContext* ctx = nullptr);

 private:
  std::shared_ptr<service::ClaimService> service_;
  ExpiryOptions                          options_;
  std::atomic<bool>                      in_flight_{false};
  std::unique_ptr<runtime::PeriodicTask> task_;
};

} // namespace claims::coordination
