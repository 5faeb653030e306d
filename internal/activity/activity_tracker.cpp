#include "activity_tracker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace claims::activity {

void ActivityTracker::Start() {
  std::lock_guard lock(mutex_);
  started_ = true;
}

void ActivityTracker::Reset() {
  std::lock_guard lock(mutex_);
  claimants_.clear();
  started_ = false;
}

bool ActivityTracker::IsStarted() const {
  std::lock_guard lock(mutex_);
  return started_;
}

ClaimantActivity& ActivityTracker::Upsert(const model::Claimant& claimant, std::uint64_t now_ms) {
  auto [it, inserted] = claimants_.try_emplace(claimant.id);
  auto& entry         = it->second;
  entry.claimant      = claimant;
  if (inserted) entry.last_activity_ms = now_ms;
  return entry;
}

void ActivityTracker::Register(const model::Claimant& claimant, std::uint64_t now_ms) {
  std::lock_guard lock(mutex_);
  Upsert(claimant, now_ms);
}

bool ActivityTracker::Unregister(const std::string& claimant_id) {
  std::lock_guard lock(mutex_);
  return claimants_.erase(claimant_id) > 0;
}

void ActivityTracker::RecordActivity(const model::Claimant& claimant, std::uint64_t now_ms) {
  std::lock_guard lock(mutex_);
  auto&           entry = Upsert(claimant, now_ms);
  entry.last_activity_ms = std::max(entry.last_activity_ms, now_ms);
}

void ActivityTracker::OnClaimAcquired(const model::Claimant& claimant, std::uint64_t now_ms) {
  std::lock_guard lock(mutex_);
  auto&           entry = Upsert(claimant, now_ms);
  ++entry.active_claims;
  entry.last_activity_ms = std::max(entry.last_activity_ms, now_ms);
}

void ActivityTracker::OnClaimReleased(const std::string& claimant_id) {
  std::lock_guard lock(mutex_);
  auto            it = claimants_.find(claimant_id);
  if (it == claimants_.end()) return;
  if (it->second.active_claims > 0) --it->second.active_claims;
}

void ActivityTracker::Rebuild(const std::vector<model::Claim>& active_claims, std::uint64_t now_ms) {
  std::lock_guard lock(mutex_);
  for (auto& [_, entry] : claimants_) entry.active_claims = 0;

  for (const auto& claim : active_claims) {
    if (!claim.claimant || !model::IsActive(claim.status)) continue;
    auto [it, inserted] = claimants_.try_emplace(claim.claimant->id);
    auto& entry         = it->second;
    if (inserted) {
      entry.claimant         = *claim.claimant;
      entry.last_activity_ms = std::min(claim.last_activity_at_ms, now_ms);
    } else {
      entry.last_activity_ms = std::max(entry.last_activity_ms, std::min(claim.last_activity_at_ms, now_ms));
    }
    ++entry.active_claims;
  }

  CLAIMS_LOG_INFO("activity tracker rebuilt", {observability::CountField("claimants", claimants_.size()),
                                               observability::CountField("active_claims", active_claims.size())});
}

std::vector<ClaimantActivity> ActivityTracker::GetIdleClaimants(std::uint64_t threshold_ms, std::uint64_t now_ms) const {
  std::vector<ClaimantActivity> idle;
  {
    std::lock_guard lock(mutex_);
    if (!started_) return idle;

    for (const auto& [_, entry] : claimants_) {
      if (entry.active_claims != 0) continue;
      const auto quiet_for = now_ms > entry.last_activity_ms ? now_ms - entry.last_activity_ms : 0;
      if (quiet_for >= threshold_ms) idle.push_back(entry);
    }
  }

  std::sort(idle.begin(), idle.end(), [](const ClaimantActivity& lhs, const ClaimantActivity& rhs) {
    if (lhs.last_activity_ms != rhs.last_activity_ms) return lhs.last_activity_ms < rhs.last_activity_ms;
    return lhs.claimant.id < rhs.claimant.id;
  });
  return idle;
}

std::optional<ClaimantActivity> ActivityTracker::Get(const std::string& claimant_id) const {
  std::lock_guard lock(mutex_);
  auto            it = claimants_.find(claimant_id);
  if (it == claimants_.end()) return std::nullopt;
  return it->second;
}

std::size_t ActivityTracker::Size() const {
  std::lock_guard lock(mutex_);
  return claimants_.size();
}

} // namespace claims::activity
