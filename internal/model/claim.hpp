#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/claimant.hpp"
#include "internal/model/state_machine.hpp"

namespace claims::model {

enum class ClaimType : std::uint8_t {
  kCoverageGap         = 0,
  kFlakyTest           = 1,
  kDefectInvestigation = 2,
  kTestReview          = 3,
};

// p0 is the most urgent tier; a lower enumerator value means higher priority.
enum class Priority : std::uint8_t {
  kP0 = 0,
  kP1 = 1,
  kP2 = 2,
  kP3 = 3,
};

enum class Severity : std::uint8_t {
  kUnspecified = 0,
  kLow         = 1,
  kMedium      = 2,
  kHigh        = 3,
  kCritical    = 4,
};

constexpr bool IsHigherPriority(Priority lhs, Priority rhs) {
  return static_cast<std::uint8_t>(lhs) < static_cast<std::uint8_t>(rhs);
}

constexpr std::string_view ToString(ClaimType type) {
  switch (type) {
    case ClaimType::kCoverageGap:
      return "coverage-gap";
    case ClaimType::kFlakyTest:
      return "flaky-test";
    case ClaimType::kDefectInvestigation:
      return "defect-investigation";
    case ClaimType::kTestReview:
    default:
      return "test-review";
  }
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kP0:
      return "p0";
    case Priority::kP1:
      return "p1";
    case Priority::kP2:
      return "p2";
    case Priority::kP3:
    default:
      return "p3";
  }
}

constexpr std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kLow:
      return "low";
    case Severity::kMedium:
      return "medium";
    case Severity::kHigh:
      return "high";
    case Severity::kCritical:
      return "critical";
    case Severity::kUnspecified:
    default:
      return "unspecified";
  }
}

std::optional<ClaimType> ParseClaimType(std::string_view value);
std::optional<Priority>  ParsePriority(std::string_view value);
std::optional<Severity>  ParseSeverity(std::string_view value);

struct HistoryEntry {
  ClaimStatus   from_status = ClaimStatus::kAvailable;
  ClaimStatus   to_status   = ClaimStatus::kAvailable;
  std::string   actor;
  std::string   reason;
  std::uint64_t timestamp_ms = 0;
  // Claimant that lost ownership in this step; empty unless the owner changed hands.
  std::string previous_claimant;
};

struct ClaimResult {
  bool                     success = false;
  std::string              summary;
  std::vector<std::string> artifacts;
  std::uint64_t            time_spent_ms = 0;
};

/*
  A leased unit of work.

  The claimant is held by value as a reference to an externally owned
  identity; claims never own claimants.

  version is the optimistic-lock counter checked by ClaimStore::Update.
*/
struct Claim {
  std::string id;
  ClaimType   type     = ClaimType::kCoverageGap;
  ClaimStatus status   = ClaimStatus::kAvailable;
  Priority    priority = Priority::kP2;
  Severity    severity = Severity::kUnspecified;

  std::string              domain;
  std::string              title;
  std::string              description;
  std::string              metadata; // opaque JSON text
  std::vector<std::string> tags;

  std::optional<Claimant> claimant;
  std::vector<Claimant>   previous_claimants;

  std::uint64_t claimed_at_ms       = 0;
  std::uint64_t last_activity_at_ms = 0;
  std::uint64_t ttl_ms              = 0;
  std::uint64_t created_at_ms       = 0;
  std::uint64_t updated_at_ms       = 0;

  std::uint32_t steal_count = 0;
  std::string   correlation_id;
  std::string   blocked_reason;

  std::optional<ClaimResult> result;

  std::uint64_t             version = 0;
  std::vector<HistoryEntry> history;

  bool IsOwnedBy(std::string_view claimant_id) const {
    return claimant.has_value() && claimant->id == claimant_id;
  }
};

// A claim is stale when it is actively held and has been silent for longer than its TTL.
constexpr bool IsStaleAt(ClaimStatus status, std::uint64_t last_activity_at_ms, std::uint64_t ttl_ms, std::uint64_t now_ms) {
  return IsActive(status) && now_ms > last_activity_at_ms && now_ms - last_activity_at_ms > ttl_ms;
}

inline bool IsStaleAt(const Claim& claim, std::uint64_t now_ms) {
  return IsStaleAt(claim.status, claim.last_activity_at_ms, claim.ttl_ms, now_ms);
}

} // namespace claims::model
