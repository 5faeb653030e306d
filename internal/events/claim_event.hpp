#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"

namespace claims::events {

enum class EventKind : std::uint8_t {
  kCreated = 0,
  kClaimed,
  kReleased,
  kCompleted,
  kAbandoned,
  kExpired,
  kStolen,
  kHandoff,
  kStatusChanged,
  kPriorityEscalated,
  kTouched,
  kHandoffRequested,
  kHandoffCancelled,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kCreated:
      return "Created";
    case EventKind::kClaimed:
      return "Claimed";
    case EventKind::kReleased:
      return "Released";
    case EventKind::kCompleted:
      return "Completed";
    case EventKind::kAbandoned:
      return "Abandoned";
    case EventKind::kExpired:
      return "Expired";
    case EventKind::kStolen:
      return "Stolen";
    case EventKind::kHandoff:
      return "Handoff";
    case EventKind::kStatusChanged:
      return "StatusChanged";
    case EventKind::kPriorityEscalated:
      return "PriorityEscalated";
    case EventKind::kTouched:
      return "Touched";
    case EventKind::kHandoffRequested:
      return "HandoffRequested";
    case EventKind::kHandoffCancelled:
    default:
      return "HandoffCancelled";
  }
}

/*
  Domain event published after a committed claim mutation.

  Delivery is at-least-once from the subscriber's point of view; handlers
  must tolerate seeing the same (claim_id, version) twice.
*/
struct ClaimEvent {
  EventKind                  kind = EventKind::kCreated;
  std::string                claim_id;
  std::string                actor;
  model::ClaimStatus         previous_status = model::ClaimStatus::kAvailable;
  model::ClaimStatus         new_status      = model::ClaimStatus::kAvailable;
  std::optional<std::string> reason;
  std::uint64_t              timestamp_ms  = 0;
  std::uint64_t              claim_version = 0;
  std::optional<std::string> handoff_id;
  // Owner before this event when ownership moved (steal, handoff, release, expiry).
  std::optional<std::string> previous_claimant;
};

} // namespace claims::events
