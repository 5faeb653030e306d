#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/events/event_bus.hpp"
#include "internal/model/handoff.hpp"

namespace claims::service {
class ClaimService;
}

namespace claims::handoff {

/*
  HandoffManager

  Consensual ownership transfers between agents and humans.

  A request only announces intent: the claim keeps its owner and status
  until an eligible acceptor calls CompleteHandoff, which performs
  ClaimService::TransferOwnership. Pending requests are cancelled when the
  claim is completed, abandoned, expired, released or stolen, and when an
  acceptance fails because the requester no longer holds the claim.

  Handoffs live in memory for the life of the process.
*/
class HandoffManager {
 public:
  HandoffManager(std::shared_ptr<service::ClaimService> service, std::shared_ptr<events::EventBus> bus);
  ~HandoffManager();

  HandoffManager(const HandoffManager&)            = delete;
  HandoffManager& operator=(const HandoffManager&) = delete;

  model::PendingHandoff RequestHumanReview(const std::string& claim_id, const std::string& requester_id, const std::string& note);
  model::PendingHandoff RequestAgentAssist(const std::string& claim_id, const std::string& requester_id, const std::string& note);

  // Oldest request first.
  std::vector<model::PendingHandoff> GetPendingByTargetKind(model::ClaimantKind kind) const;
  model::PendingHandoff              Get(const std::string& handoff_id) const;

  model::PendingHandoff CompleteHandoff(const std::string& handoff_id, const model::Claimant& new_claimant);
  model::PendingHandoff CancelHandoff(const std::string& handoff_id, const std::string& reason = "cancelled");

 private:
  model::PendingHandoff Request(const std::string& claim_id, const std::string& requester_id, const std::string& note,
                                model::ClaimantKind target);
  void                  OnClaimEvent(const events::ClaimEvent& event);
  bool                  RequesterStillHolds(const model::PendingHandoff& handoff) const;
  void                  Announce(events::EventKind kind, const model::PendingHandoff& handoff, const std::string& actor,
                                 const std::string& reason);

  std::shared_ptr<service::ClaimService> service_;
  std::shared_ptr<events::EventBus>      bus_;
  events::EventBus::SubscriptionId       subscription_ = 0;

  mutable std::mutex                                     mutex_;
  std::unordered_map<std::string, model::PendingHandoff> handoffs_;
  std::unordered_set<std::string>                        accepting_;
};

} // namespace claims::handoff
