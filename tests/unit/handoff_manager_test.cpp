#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/activity/activity_tracker.hpp"
#include "internal/db/memory/memory_claim_store.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/handoff/handoff_manager.hpp"
#include "internal/service/claim_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using claims::events::ClaimEvent;
using claims::events::EventKind;
using claims::handoff::HandoffManager;
using claims::model::Claimant;
using claims::model::ClaimantKind;
using claims::model::ClaimStatus;
using claims::model::HandoffStatus;
using claims::util::ErrorKind;

struct Harness {
  Harness() {
    clock    = std::make_shared<claims::util::ManualTimeSource>(3'000'000);
    bus      = std::make_shared<claims::events::EventBus>();
    service  = std::make_shared<claims::service::ClaimService>(std::make_shared<claims::db::memory::MemoryClaimStore>(),
                                                               std::make_shared<claims::activity::ActivityTracker>(), bus, clock);
    handoffs = std::make_unique<HandoffManager>(service, bus);
    bus->Subscribe([this](const ClaimEvent& e) { events.push_back(e); });
  }

  std::string InProgress(const std::string& agent) {
    claims::service::NewClaim request;
    request.domain = "payments";
    request.title  = "defect triage";
    request.type   = claims::model::ClaimType::kDefectInvestigation;
    const auto id  = service->CreateClaim(request).id;
    service->Claim(id, Agent(agent));
    service->StartWork(id, agent);
    return id;
  }

  static Claimant Agent(const std::string& id) {
    return Claimant{id, ClaimantKind::kAgent, id, "payments", "tester"};
  }

  static Claimant Human(const std::string& id) {
    return Claimant{id, ClaimantKind::kHuman, id, "payments", ""};
  }

  std::shared_ptr<claims::util::ManualTimeSource> clock;
  std::shared_ptr<claims::events::EventBus>       bus;
  std::shared_ptr<claims::service::ClaimService>  service;
  std::unique_ptr<HandoffManager>                 handoffs;
  std::vector<ClaimEvent>                         events;
};

template <typename Fn>
ErrorKind ExpectError(Fn&& fn) {
  try {
    fn();
  } catch (const claims::util::ClaimError& e) {
    return e.Kind();
  }
  assert(false && "expected a ClaimError");
  return ErrorKind::kValidation;
}

void TestHumanReviewKeepsStatusUntilAccepted() {
  Harness    h;
  const auto id = h.InProgress("A1");

  auto pending = h.handoffs->RequestHumanReview(id, "A1", "check edge cases");
  assert(pending.id.rfind("handoff_", 0) == 0);
  assert(pending.status == HandoffStatus::kPending);
  assert(pending.requested_to_kind == ClaimantKind::kHuman);
  assert(pending.from_claimant.id == "A1");
  assert(h.events.back().kind == EventKind::kHandoffRequested);

  auto claim = h.service->GetClaim(id);
  assert(claim.status == ClaimStatus::kInProgress);
  assert(claim.IsOwnedBy("A1"));

  auto queue = h.handoffs->GetPendingByTargetKind(ClaimantKind::kHuman);
  assert(queue.size() == 1 && queue[0].id == pending.id);
  assert(h.handoffs->GetPendingByTargetKind(ClaimantKind::kAgent).empty());

  h.clock->Advance(20min);
  auto done = h.handoffs->CompleteHandoff(pending.id, Harness::Human("H1"));
  assert(done.status == HandoffStatus::kCompleted);
  assert(done.accepted_by == "H1");
  assert(done.resolved_at_ms == h.clock->NowMs());

  claim = h.service->GetClaim(id);
  assert(claim.IsOwnedBy("H1"));
  assert(claim.status == ClaimStatus::kInProgress);
  assert(claim.ttl_ms == 3600000);
  assert(claim.previous_claimants.back().id == "A1");

  const auto& handoff_event = h.events.back();
  assert(handoff_event.kind == EventKind::kHandoff);
  assert(handoff_event.reason == std::optional<std::string>("check edge cases"));
  assert(handoff_event.handoff_id == std::optional<std::string>(pending.id));
  assert(handoff_event.previous_status == ClaimStatus::kInProgress);
  assert(handoff_event.new_status == ClaimStatus::kInProgress);

  assert(h.handoffs->GetPendingByTargetKind(ClaimantKind::kHuman).empty());
  assert(ExpectError([&] { h.handoffs->CompleteHandoff(pending.id, Harness::Human("H2")); }) == ErrorKind::kHandoffAlreadyResolved);
  assert(ExpectError([&] { h.handoffs->CancelHandoff(pending.id); }) == ErrorKind::kHandoffAlreadyResolved);
}

void TestAgentAssist() {
  Harness    h;
  const auto id      = h.InProgress("A1");
  h.service->Block(id, "A1", "needs fixture");
  auto       pending = h.handoffs->RequestAgentAssist(id, "A1", "take over the fixture work");
  assert(pending.requested_to_kind == ClaimantKind::kAgent);

  assert(ExpectError([&] { h.handoffs->CompleteHandoff(pending.id, Harness::Human("H1")); }) == ErrorKind::kValidation);
  assert(ExpectError([&] { h.handoffs->CompleteHandoff(pending.id, Harness::Agent("A1")); }) == ErrorKind::kValidation);

  h.handoffs->CompleteHandoff(pending.id, Harness::Agent("A2"));
  auto claim = h.service->GetClaim(id);
  assert(claim.IsOwnedBy("A2"));
  assert(claim.status == ClaimStatus::kBlocked);
}

void TestRequestValidation() {
  Harness    h;
  const auto id = h.InProgress("A1");

  try {
    h.handoffs->RequestHumanReview(id, "A2", "not mine");
    assert(false);
  } catch (const claims::util::ClaimNotOwnedByRequester& e) {
    assert(e.Snapshot().has_value() && e.Snapshot()->IsOwnedBy("A1"));
  }
  assert(ExpectError([&] { h.handoffs->RequestHumanReview("claim_missing", "A1", ""); }) == ErrorKind::kNotFound);

  h.handoffs->RequestHumanReview(id, "A1", "first");
  assert(ExpectError([&] { h.handoffs->RequestAgentAssist(id, "A1", "second"); }) == ErrorKind::kValidation);

  assert(ExpectError([&] { h.handoffs->Get("handoff_missing"); }) == ErrorKind::kHandoffNotFound);
  assert(ExpectError([&] { h.handoffs->CompleteHandoff("handoff_missing", Harness::Human("H1")); }) == ErrorKind::kHandoffNotFound);
  assert(ExpectError([&] { h.handoffs->CancelHandoff("handoff_missing"); }) == ErrorKind::kHandoffNotFound);
}

void TestExplicitCancel() {
  Harness    h;
  const auto id      = h.InProgress("A1");
  auto       pending = h.handoffs->RequestHumanReview(id, "A1", "please look");

  auto cancelled = h.handoffs->CancelHandoff(pending.id);
  assert(cancelled.status == HandoffStatus::kCancelled);
  assert(h.events.back().kind == EventKind::kHandoffCancelled);
  assert(h.handoffs->Get(pending.id).status == HandoffStatus::kCancelled);
  assert(h.service->GetClaim(id).IsOwnedBy("A1"));

  // a new request is allowed once the previous one is resolved
  h.handoffs->RequestHumanReview(id, "A1", "again");
}

void TestTerminalClaimCancelsPendingHandoff() {
  Harness    h;
  const auto id      = h.InProgress("A1");
  auto       pending = h.handoffs->RequestHumanReview(id, "A1", "review");

  h.service->Complete(id, "A1", {});
  assert(h.handoffs->Get(pending.id).status == HandoffStatus::kCancelled);

  std::size_t cancelled_events = 0;
  for (const auto& e : h.events) {
    if (e.kind == EventKind::kHandoffCancelled && e.handoff_id == std::optional<std::string>(pending.id)) ++cancelled_events;
  }
  assert(cancelled_events == 1);
  assert(ExpectError([&] { h.handoffs->CompleteHandoff(pending.id, Harness::Human("H1")); }) == ErrorKind::kHandoffAlreadyResolved);

  // requests on terminal claims are rejected outright
  assert(ExpectError([&] { h.handoffs->RequestHumanReview(id, "A1", "late"); }) == ErrorKind::kInvalidTransition);
}

void TestStealCancelsPendingHandoff() {
  Harness    h;
  const auto id      = h.InProgress("A1");
  auto       pending = h.handoffs->RequestAgentAssist(id, "A1", "help");

  h.clock->Advance(6min);
  h.service->Steal(id, Harness::Agent("A2"));
  assert(h.handoffs->Get(pending.id).status == HandoffStatus::kCancelled);
  assert(h.handoffs->GetPendingByTargetKind(ClaimantKind::kAgent).empty());
}

void TestOwnerChangeBeforeAcceptanceFails() {
  Harness    h;
  const auto id      = h.InProgress("A1");
  auto       pending = h.handoffs->RequestHumanReview(id, "A1", "review");

  // a second transfer path moves the claim away without ending it
  h.service->TransferOwnership(id, "A1", Harness::Agent("A3"), "reassigned");
  assert(ExpectError([&] { h.handoffs->CompleteHandoff(pending.id, Harness::Human("H1")); }) == ErrorKind::kClaimNotOwnedByRequester);
  assert(h.handoffs->Get(pending.id).status == HandoffStatus::kCancelled);
  assert(h.handoffs->GetPendingByTargetKind(ClaimantKind::kHuman).empty());
  assert(h.service->GetClaim(id).IsOwnedBy("A3"));
}

void TestFailedAcceptanceOfFinishedClaimCancels() {
  // no bus: the completion below is not observed, as when it lands mid-acceptance
  auto clock    = std::make_shared<claims::util::ManualTimeSource>(3'000'000);
  auto service  = std::make_shared<claims::service::ClaimService>(std::make_shared<claims::db::memory::MemoryClaimStore>(), nullptr,
                                                                 nullptr, clock);
  auto handoffs = std::make_unique<HandoffManager>(service, nullptr);

  claims::service::NewClaim request;
  request.domain = "payments";
  request.title  = "defect triage";
  request.type   = claims::model::ClaimType::kDefectInvestigation;
  const auto id  = service->CreateClaim(request).id;
  service->Claim(id, Harness::Agent("A1"));
  service->StartWork(id, "A1");

  auto pending = handoffs->RequestHumanReview(id, "A1", "review");
  service->Complete(id, "A1", {});
  assert(handoffs->GetPendingByTargetKind(ClaimantKind::kHuman).size() == 1);

  assert(ExpectError([&] { handoffs->CompleteHandoff(pending.id, Harness::Human("H1")); }) == ErrorKind::kInvalidTransition);
  assert(handoffs->Get(pending.id).status == HandoffStatus::kCancelled);
  assert(handoffs->GetPendingByTargetKind(ClaimantKind::kHuman).empty());
  assert(service->GetClaim(id).status == ClaimStatus::kCompleted);
}

void TestFailedAcceptanceKeepsLiveRequest() {
  Harness    h;
  const auto id      = h.InProgress("A1");
  auto       pending = h.handoffs->RequestHumanReview(id, "A1", "review");

  // the acceptor is rejected, the requester still holds the claim
  assert(ExpectError([&] { h.handoffs->CompleteHandoff(pending.id, Claimant{"", ClaimantKind::kHuman, "", "", ""}); }) ==
         ErrorKind::kValidation);
  assert(h.handoffs->Get(pending.id).status == HandoffStatus::kPending);
  assert(h.handoffs->CompleteHandoff(pending.id, Harness::Human("H1")).status == HandoffStatus::kCompleted);
}

} // namespace

int main() {
  TestHumanReviewKeepsStatusUntilAccepted();
  TestAgentAssist();
  TestRequestValidation();
  TestExplicitCancel();
  TestTerminalClaimCancelsPendingHandoff();
  TestStealCancelsPendingHandoff();
  TestOwnerChangeBeforeAcceptanceFails();
  TestFailedAcceptanceOfFinishedClaimCancels();
  TestFailedAcceptanceKeepsLiveRequest();

  std::cout << "claims_unit_handoff_manager: pass\n";
  return 0;
}
