#include "internal/db/api/claim_store.hpp"

#include <algorithm>

namespace claims::db {

namespace {

bool SameEntry(const model::HistoryEntry& lhs, const model::HistoryEntry& rhs) {
  return lhs.from_status == rhs.from_status && lhs.to_status == rhs.to_status && lhs.actor == rhs.actor && lhs.reason == rhs.reason &&
         lhs.timestamp_ms == rhs.timestamp_ms && lhs.previous_claimant == rhs.previous_claimant;
}

} // namespace

bool Matches(const model::Claim& claim, const ClaimFilter& filter) {
  if (filter.status && claim.status != *filter.status) return false;
  if (filter.domain && claim.domain != *filter.domain) return false;
  if (filter.priority && claim.priority != *filter.priority) return false;
  if (filter.type && claim.type != *filter.type) return false;
  if (filter.claimant_id && !claim.IsOwnedBy(*filter.claimant_id)) return false;

  for (const auto& tag : filter.tags) {
    if (std::find(claim.tags.begin(), claim.tags.end(), tag) == claim.tags.end()) return false;
  }
  return true;
}

bool ListOrder(const model::Claim& lhs, const model::Claim& rhs) {
  if (lhs.priority != rhs.priority) return model::IsHigherPriority(lhs.priority, rhs.priority);
  if (lhs.created_at_ms != rhs.created_at_ms) return lhs.created_at_ms < rhs.created_at_ms;
  return lhs.id < rhs.id;
}

void SortAndLimit(std::vector<model::Claim>& claims, std::size_t limit) {
  std::sort(claims.begin(), claims.end(), ListOrder);
  if (limit > 0 && claims.size() > limit) {
    claims.resize(limit);
  }
}

Result ValidateNewClaim(const model::Claim& claim) {
  if (claim.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "claim id is required");
  if (claim.title.empty()) return Result::Err(ErrorCode::ConstraintViolation, "claim title is required");
  if (claim.domain.empty()) return Result::Err(ErrorCode::ConstraintViolation, "claim domain is required");
  return Result::Ok();
}

Result ValidateMutation(const model::Claim& before, const model::Claim& after) {
  if (after.id != before.id || after.created_at_ms != before.created_at_ms || after.version != before.version) {
    return Result::Err(ErrorCode::ConstraintViolation, "claim identity fields are immutable");
  }

  if (after.status != before.status && !model::CanTransition(before.status, after.status)) {
    return Result::Err(ErrorCode::ConstraintViolation,
                       "transition " + std::string(model::ToString(before.status)) + " -> " + std::string(model::ToString(after.status)) +
                           " is not allowed");
  }

  if (after.history.size() < before.history.size()) {
    return Result::Err(ErrorCode::ConstraintViolation, "claim history is append-only");
  }
  for (std::size_t i = 0; i < before.history.size(); ++i) {
    if (!SameEntry(before.history[i], after.history[i])) {
      return Result::Err(ErrorCode::ConstraintViolation, "claim history entries are immutable");
    }
  }

  if (after.status != before.status && after.history.size() == before.history.size()) {
    return Result::Err(ErrorCode::ConstraintViolation, "status change without history entry");
  }

  if (!model::IsTerminal(after.status) && after.last_activity_at_ms < before.last_activity_at_ms) {
    return Result::Err(ErrorCode::ConstraintViolation, "last activity must not move backwards");
  }

  if (model::IsActive(after.status) && !after.claimant.has_value()) {
    return Result::Err(ErrorCode::ConstraintViolation, "active claim requires a claimant");
  }

  return Result::Ok();
}

} // namespace claims::db
