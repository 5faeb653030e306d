#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace claims::model {

enum class ClaimStatus : std::uint8_t {
  kAvailable  = 0,
  kClaimed    = 1,
  kInProgress = 2,
  kBlocked    = 3,
  kCompleted  = 4,
  kReleased   = 5,
  kExpired    = 6,
  kAbandoned  = 7,
};

constexpr bool IsTerminal(ClaimStatus status) {
  return status == ClaimStatus::kCompleted || status == ClaimStatus::kExpired || status == ClaimStatus::kAbandoned;
}

// Statuses in which a claimant holds the claim.
constexpr bool IsActive(ClaimStatus status) {
  return status == ClaimStatus::kClaimed || status == ClaimStatus::kInProgress || status == ClaimStatus::kBlocked;
}

/*
  The complete claim transition table.

    available   -> claimed                         (claim)
    claimed     -> in-progress                     (startWork)
    in-progress <-> blocked                        (block / unblock)
    active      -> completed | available | abandoned | expired
    active      -> claimed                         (steal)
    active      -> same status                     (handoff transfer)

  Nothing leaves a terminal status and nothing enters kReleased.
*/
constexpr bool CanTransition(ClaimStatus from, ClaimStatus to) {
  if (IsTerminal(from) || to == ClaimStatus::kReleased) {
    return false;
  }

  if (from == ClaimStatus::kAvailable) {
    return to == ClaimStatus::kClaimed;
  }

  if (!IsActive(from)) {
    return false;
  }

  if (from == to) {
    return true;
  }

  switch (to) {
    case ClaimStatus::kCompleted:
    case ClaimStatus::kAvailable:
    case ClaimStatus::kAbandoned:
    case ClaimStatus::kExpired:
    case ClaimStatus::kClaimed:
      return true;
    case ClaimStatus::kInProgress:
      return from == ClaimStatus::kClaimed || from == ClaimStatus::kBlocked;
    case ClaimStatus::kBlocked:
      return from == ClaimStatus::kInProgress;
    default:
      return false;
  }
}

constexpr std::string_view ToString(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::kAvailable:
      return "available";
    case ClaimStatus::kClaimed:
      return "claimed";
    case ClaimStatus::kInProgress:
      return "in-progress";
    case ClaimStatus::kBlocked:
      return "blocked";
    case ClaimStatus::kCompleted:
      return "completed";
    case ClaimStatus::kReleased:
      return "released";
    case ClaimStatus::kExpired:
      return "expired";
    case ClaimStatus::kAbandoned:
    default:
      return "abandoned";
  }
}

std::optional<ClaimStatus> ParseClaimStatus(std::string_view value);

} // namespace claims::model
