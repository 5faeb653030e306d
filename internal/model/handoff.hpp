#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/claimant.hpp"

namespace claims::model {

enum class HandoffStatus : std::uint8_t {
  kPending   = 0,
  kCompleted = 1,
  kCancelled = 2,
};

constexpr std::string_view ToString(HandoffStatus status) {
  switch (status) {
    case HandoffStatus::kPending:
      return "pending";
    case HandoffStatus::kCompleted:
      return "completed";
    case HandoffStatus::kCancelled:
    default:
      return "cancelled";
  }
}

struct PendingHandoff {
  std::string   id;
  std::string   claim_id;
  Claimant      from_claimant;
  ClaimantKind  requested_to_kind = ClaimantKind::kHuman;
  std::string   note;
  HandoffStatus status        = HandoffStatus::kPending;
  std::uint64_t created_at_ms = 0;
  std::uint64_t resolved_at_ms = 0;
  std::string   accepted_by;
};

} // namespace claims::model
