#pragma once

#include <cstdint>
#include <string_view>

namespace claims::service {

// What the expiry sweep does with a stale claim, chosen per claimant kind.
enum class ExpiryAction : std::uint8_t {
  kRequeue = 0, // back to available, claimant cleared
  kExpire  = 1, // terminal expired
};

constexpr std::string_view ToString(ExpiryAction action) {
  return action == ExpiryAction::kRequeue ? "requeue" : "expire";
}

struct ServiceOptions {
  std::uint64_t agent_ttl_ms       = 300'000;
  std::uint64_t human_ttl_ms       = 3'600'000;
  std::uint32_t max_steal_count    = 3; // 0 = unlimited
  bool          requeue_on_abandon = false;
  ExpiryAction  agent_expiry       = ExpiryAction::kRequeue;
  ExpiryAction  human_expiry       = ExpiryAction::kExpire;
};

} // namespace claims::service
