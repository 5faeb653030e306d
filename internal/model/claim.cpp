#include "internal/model/claim.hpp"

#include <array>

namespace claims::model {

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> Lookup(const std::array<Enum, N>& values, std::string_view value) {
  for (auto candidate : values) {
    if (ToString(candidate) == value) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<ClaimType> ParseClaimType(std::string_view value) {
  static constexpr std::array kTypes = {ClaimType::kCoverageGap, ClaimType::kFlakyTest, ClaimType::kDefectInvestigation, ClaimType::kTestReview};
  return Lookup(kTypes, value);
}

std::optional<Priority> ParsePriority(std::string_view value) {
  static constexpr std::array kPriorities = {Priority::kP0, Priority::kP1, Priority::kP2, Priority::kP3};
  return Lookup(kPriorities, value);
}

std::optional<Severity> ParseSeverity(std::string_view value) {
  static constexpr std::array kSeverities = {Severity::kUnspecified, Severity::kLow, Severity::kMedium, Severity::kHigh, Severity::kCritical};
  return Lookup(kSeverities, value);
}

std::optional<ClaimStatus> ParseClaimStatus(std::string_view value) {
  static constexpr std::array kStatuses = {ClaimStatus::kAvailable, ClaimStatus::kClaimed,  ClaimStatus::kInProgress, ClaimStatus::kBlocked,
                                           ClaimStatus::kCompleted, ClaimStatus::kReleased, ClaimStatus::kExpired,    ClaimStatus::kAbandoned};
  return Lookup(kStatuses, value);
}

std::optional<ClaimantKind> ParseClaimantKind(std::string_view value) {
  static constexpr std::array kKinds = {ClaimantKind::kAgent, ClaimantKind::kHuman};
  return Lookup(kKinds, value);
}

} // namespace claims::model
