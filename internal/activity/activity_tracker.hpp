#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/claim.hpp"

namespace claims::activity {

struct ClaimantActivity {
  model::Claimant claimant;
  std::uint64_t   last_activity_ms = 0;
  std::uint32_t   active_claims    = 0;
};

/*
  ActivityTracker

  Registry of known claimants and how recently each one did something.
  Idleness is a claimant property: a claimant is idle when it holds no
  active claims and has been quiet for at least the threshold, whatever the
  staleness of claims it once held.

  Owned by the composition root and passed to the services that need it.
  State only changes through successful claim operations (and Rebuild at
  startup), so one mutex over the map is enough.
*/
class ActivityTracker {
 public:
  void Start();
  void Reset();
  bool IsStarted() const;

  void Register(const model::Claimant& claimant, std::uint64_t now_ms);
  bool Unregister(const std::string& claimant_id);

  // Registers unknown claimants. Never moves last activity backwards.
  void RecordActivity(const model::Claimant& claimant, std::uint64_t now_ms);

  void OnClaimAcquired(const model::Claimant& claimant, std::uint64_t now_ms);
  void OnClaimReleased(const std::string& claimant_id);

  // Replaces every active claim count with what the given claims say.
  void Rebuild(const std::vector<model::Claim>& active_claims, std::uint64_t now_ms);

  // Oldest activity first, ties broken by claimant id.
  std::vector<ClaimantActivity> GetIdleClaimants(std::uint64_t threshold_ms, std::uint64_t now_ms) const;

  std::optional<ClaimantActivity> Get(const std::string& claimant_id) const;
  std::size_t                     Size() const;

 private:
  ClaimantActivity& Upsert(const model::Claimant& claimant, std::uint64_t now_ms);

  mutable std::mutex                                mutex_;
  bool                                              started_ = false;
  std::unordered_map<std::string, ClaimantActivity> claimants_;
};

} // namespace claims::activity
