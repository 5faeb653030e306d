#pragma once

#include <chrono>
#include <cstdint>

namespace claims::coordination {

struct WorkStealingOptions {
  bool                      enabled              = true;
  std::chrono::milliseconds interval             = std::chrono::seconds(10);
  std::uint64_t             idle_threshold_ms    = 5'000;
  // Minimum silence for a stale claim to be stolen; 0 leaves the decision to the claim TTL.
  std::uint64_t             stale_threshold_ms   = 0;
  bool                      allow_cross_domain   = false;
  std::uint32_t             max_steals_per_cycle = 0; // 0 = unbounded
  std::chrono::milliseconds cycle_deadline       = std::chrono::seconds(5);
};

struct ExpiryOptions {
  bool                      enabled        = true;
  std::chrono::milliseconds interval       = std::chrono::seconds(30);
  std::chrono::milliseconds sweep_deadline = std::chrono::seconds(5);
};

} // namespace claims::coordination
