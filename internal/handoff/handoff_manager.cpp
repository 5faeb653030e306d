#include "handoff_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/claim_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace claims::handoff {

namespace {

bool EndsPendingHandoffs(events::EventKind kind) {
  switch (kind) {
    case events::EventKind::kCompleted:
    case events::EventKind::kAbandoned:
    case events::EventKind::kExpired:
    case events::EventKind::kReleased:
    case events::EventKind::kStolen:
      return true;
    default:
      return false;
  }
}

} // namespace

HandoffManager::HandoffManager(std::shared_ptr<service::ClaimService> service, std::shared_ptr<events::EventBus> bus)
    : service_(std::move(service)), bus_(std::move(bus)) {
  if (bus_) {
    subscription_ = bus_->Subscribe([this](const events::ClaimEvent& event) {
      OnClaimEvent(event);
    });
  }
}

HandoffManager::~HandoffManager() {
  if (bus_ && subscription_ != 0) bus_->Unsubscribe(subscription_);
}

model::PendingHandoff HandoffManager::RequestHumanReview(const std::string& claim_id, const std::string& requester_id,
                                                         const std::string& note) {
  return Request(claim_id, requester_id, note, model::ClaimantKind::kHuman);
}

model::PendingHandoff HandoffManager::RequestAgentAssist(const std::string& claim_id, const std::string& requester_id,
                                                         const std::string& note) {
  return Request(claim_id, requester_id, note, model::ClaimantKind::kAgent);
}

model::PendingHandoff HandoffManager::Request(const std::string& claim_id, const std::string& requester_id, const std::string& note,
                                              model::ClaimantKind target) {
  observability::SpanScope span("HandoffManager.Request");
  span.SetAttribute("claim_id", claim_id);

  if (requester_id.empty()) throw util::ValidationError("requester id is required");

  const auto claim = service_->GetClaim(claim_id);
  if (!claim.IsOwnedBy(requester_id)) {
    throw util::ClaimNotOwnedByRequester(requester_id + " does not own claim " + claim_id, claim);
  }
  if (!model::IsActive(claim.status)) {
    throw util::InvalidTransition("cannot request a handoff for " + std::string(model::ToString(claim.status)) + " claim " + claim_id, claim);
  }

  model::PendingHandoff handoff;
  handoff.id                = util::GenerateId("handoff");
  handoff.claim_id          = claim_id;
  handoff.from_claimant     = *claim.claimant;
  handoff.requested_to_kind = target;
  handoff.note              = note;
  handoff.created_at_ms     = service_->NowMs();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, existing] : handoffs_) {
      if (existing.claim_id == claim_id && existing.status == model::HandoffStatus::kPending) {
        throw util::ValidationError("claim " + claim_id + " already has pending handoff " + id);
      }
    }
    handoffs_.emplace(handoff.id, handoff);
  }

  CLAIMS_LOG_INFO("handoff requested", {observability::StringField("handoff_id", handoff.id), observability::StringField("claim_id", claim_id),
                                        observability::StringField("from", requester_id),
                                        observability::StringField("to_kind", model::ToString(target))});
  Announce(events::EventKind::kHandoffRequested, handoff, requester_id, note);
  return handoff;
}

std::vector<model::PendingHandoff> HandoffManager::GetPendingByTargetKind(model::ClaimantKind kind) const {
  std::vector<model::PendingHandoff> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, handoff] : handoffs_) {
      if (handoff.status == model::HandoffStatus::kPending && handoff.requested_to_kind == kind) out.push_back(handoff);
    }
  }
  std::sort(out.begin(), out.end(), [](const model::PendingHandoff& a, const model::PendingHandoff& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

model::PendingHandoff HandoffManager::Get(const std::string& handoff_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = handoffs_.find(handoff_id);
  if (it == handoffs_.end()) throw util::HandoffNotFound("handoff not found: " + handoff_id);
  return it->second;
}

model::PendingHandoff HandoffManager::CompleteHandoff(const std::string& handoff_id, const model::Claimant& new_claimant) {
  observability::SpanScope span("HandoffManager.CompleteHandoff");
  span.SetAttribute("handoff_id", handoff_id);

  model::PendingHandoff handoff;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = handoffs_.find(handoff_id);
    if (it == handoffs_.end()) throw util::HandoffNotFound("handoff not found: " + handoff_id);
    if (it->second.status != model::HandoffStatus::kPending || accepting_.count(handoff_id) != 0) {
      throw util::HandoffAlreadyResolved("handoff " + handoff_id + " is " + std::string(model::ToString(it->second.status)));
    }
    if (new_claimant.kind != it->second.requested_to_kind) {
      throw util::ValidationError("handoff " + handoff_id + " expects a " + std::string(model::ToString(it->second.requested_to_kind)) +
                                  " acceptor");
    }
    if (new_claimant.id == it->second.from_claimant.id) {
      throw util::ValidationError("requester cannot accept its own handoff " + handoff_id);
    }
    accepting_.insert(handoff_id);
    handoff = it->second;
  }

  try {
    service_->TransferOwnership(handoff.claim_id, handoff.from_claimant.id, new_claimant, handoff.note, handoff.id);
  } catch (const std::exception&) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      accepting_.erase(handoff_id);
    }
    // Claim events seen while accepting were skipped; drop the request if it can no longer succeed.
    if (!RequesterStillHolds(handoff)) {
      try {
        CancelHandoff(handoff_id, "claim no longer held by requester");
      } catch (const util::HandoffAlreadyResolved&) {
        // resolved concurrently
      }
    }
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_.erase(handoff_id);
    auto& stored          = handoffs_.at(handoff_id);
    stored.status         = model::HandoffStatus::kCompleted;
    stored.accepted_by    = new_claimant.id;
    stored.resolved_at_ms = service_->NowMs();
    handoff               = stored;
  }

  CLAIMS_LOG_INFO("handoff completed", {observability::StringField("handoff_id", handoff_id),
                                        observability::StringField("claim_id", handoff.claim_id),
                                        observability::StringField("accepted_by", new_claimant.id)});
  return handoff;
}

model::PendingHandoff HandoffManager::CancelHandoff(const std::string& handoff_id, const std::string& reason) {
  model::PendingHandoff handoff;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = handoffs_.find(handoff_id);
    if (it == handoffs_.end()) throw util::HandoffNotFound("handoff not found: " + handoff_id);
    if (it->second.status != model::HandoffStatus::kPending || accepting_.count(handoff_id) != 0) {
      throw util::HandoffAlreadyResolved("handoff " + handoff_id + " is " + std::string(model::ToString(it->second.status)));
    }
    it->second.status         = model::HandoffStatus::kCancelled;
    it->second.resolved_at_ms = service_->NowMs();
    handoff                   = it->second;
  }

  CLAIMS_LOG_INFO("handoff cancelled", {observability::StringField("handoff_id", handoff_id),
                                        observability::StringField("claim_id", handoff.claim_id), observability::StringField("reason", reason)});
  Announce(events::EventKind::kHandoffCancelled, handoff, "system", reason);
  return handoff;
}

void HandoffManager::OnClaimEvent(const events::ClaimEvent& event) {
  if (!EndsPendingHandoffs(event.kind)) return;

  std::vector<std::string> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, handoff] : handoffs_) {
      if (handoff.claim_id == event.claim_id && handoff.status == model::HandoffStatus::kPending && accepting_.count(id) == 0) {
        pending.push_back(id);
      }
    }
  }

  for (const auto& id : pending) {
    try {
      CancelHandoff(id, "claim " + std::string(events::ToString(event.kind)));
    } catch (const util::HandoffAlreadyResolved&) {
      // resolved concurrently
    }
  }
}

bool HandoffManager::RequesterStillHolds(const model::PendingHandoff& handoff) const {
  try {
    const auto claim = service_->GetClaim(handoff.claim_id);
    return model::IsActive(claim.status) && claim.IsOwnedBy(handoff.from_claimant.id);
  } catch (const util::NotFound&) {
    return false;
  }
}

void HandoffManager::Announce(events::EventKind kind, const model::PendingHandoff& handoff, const std::string& actor,
                              const std::string& reason) {
  if (!bus_) return;

  events::ClaimEvent event;
  event.kind     = kind;
  event.claim_id = handoff.claim_id;
  event.actor    = actor;
  try {
    const auto claim      = service_->GetClaim(handoff.claim_id);
    event.previous_status = claim.status;
    event.new_status      = claim.status;
    event.claim_version   = claim.version;
  } catch (const util::NotFound&) {
    CLAIMS_LOG_WARN("handoff claim disappeared", {observability::StringField("handoff_id", handoff.id),
                                                  observability::StringField("claim_id", handoff.claim_id)});
  }
  event.reason       = reason;
  event.timestamp_ms = service_->NowMs();
  event.handoff_id   = handoff.id;
  bus_->Publish(event);
}

} // namespace claims::handoff
