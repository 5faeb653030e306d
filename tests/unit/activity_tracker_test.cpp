#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/activity/activity_tracker.hpp"

namespace {

using claims::activity::ActivityTracker;
using claims::model::Claimant;
using claims::model::ClaimantKind;

Claimant Agent(const std::string& id, const std::string& domain = "payments") {
  return Claimant{id, ClaimantKind::kAgent, id, domain, "tester"};
}

void TestIdleRequiresStart() {
  ActivityTracker tracker;
  tracker.Register(Agent("agent-1"), 0);
  assert(tracker.GetIdleClaimants(10, 1000).empty());

  tracker.Start();
  assert(tracker.IsStarted());
  assert(tracker.GetIdleClaimants(10, 1000).size() == 1);

  tracker.Reset();
  assert(!tracker.IsStarted());
  assert(tracker.Size() == 0);
}

void TestIdleThresholdIsInclusive() {
  ActivityTracker tracker;
  tracker.Start();
  tracker.Register(Agent("agent-1"), 1000);

  assert(tracker.GetIdleClaimants(5000, 5999).empty());
  assert(tracker.GetIdleClaimants(5000, 6000).size() == 1);
}

void TestActiveClaimsKeepClaimantBusy() {
  ActivityTracker tracker;
  tracker.Start();
  tracker.OnClaimAcquired(Agent("agent-1"), 1000);
  tracker.OnClaimAcquired(Agent("agent-1"), 1100);
  assert(tracker.Get("agent-1")->active_claims == 2);
  assert(tracker.GetIdleClaimants(0, 100000).empty());

  tracker.OnClaimReleased("agent-1");
  assert(tracker.GetIdleClaimants(0, 100000).empty());
  tracker.OnClaimReleased("agent-1");
  tracker.OnClaimReleased("agent-1");
  assert(tracker.Get("agent-1")->active_claims == 0);
  assert(tracker.GetIdleClaimants(0, 100000).size() == 1);

  // unknown claimants are ignored
  tracker.OnClaimReleased("ghost");
  assert(!tracker.Get("ghost").has_value());
}

void TestActivityNeverMovesBackwards() {
  ActivityTracker tracker;
  tracker.RecordActivity(Agent("agent-1"), 5000);
  tracker.RecordActivity(Agent("agent-1"), 3000);
  assert(tracker.Get("agent-1")->last_activity_ms == 5000);

  // registering again refreshes the identity but not the clock
  tracker.Register(Agent("agent-1", "search"), 9000);
  assert(tracker.Get("agent-1")->last_activity_ms == 5000);
  assert(tracker.Get("agent-1")->claimant.domain == "search");
}

void TestIdleOrderIsOldestFirst() {
  ActivityTracker tracker;
  tracker.Start();
  tracker.Register(Agent("agent-c"), 300);
  tracker.Register(Agent("agent-b"), 100);
  tracker.Register(Agent("agent-a"), 100);
  tracker.Register(Agent("agent-d"), 200);

  auto idle = tracker.GetIdleClaimants(0, 1000);
  assert(idle.size() == 4);
  assert(idle[0].claimant.id == "agent-a");
  assert(idle[1].claimant.id == "agent-b");
  assert(idle[2].claimant.id == "agent-d");
  assert(idle[3].claimant.id == "agent-c");
}

void TestRebuildFromActiveClaims() {
  ActivityTracker tracker;
  tracker.OnClaimAcquired(Agent("agent-1"), 100);
  tracker.Register(Agent("agent-2"), 100);

  std::vector<claims::model::Claim> active(2);
  active[0].status              = claims::model::ClaimStatus::kInProgress;
  active[0].claimant            = Agent("agent-2");
  active[0].last_activity_at_ms = 400;
  active[1].status              = claims::model::ClaimStatus::kBlocked;
  active[1].claimant            = Agent("agent-3");
  active[1].last_activity_at_ms = 800;

  tracker.Rebuild(active, 1000);
  assert(tracker.Get("agent-1")->active_claims == 0);
  assert(tracker.Get("agent-2")->active_claims == 1);
  assert(tracker.Get("agent-2")->last_activity_ms == 400);
  assert(tracker.Get("agent-3")->active_claims == 1);
  assert(tracker.Get("agent-3")->last_activity_ms == 800);
  assert(tracker.Size() == 3);

  assert(tracker.Unregister("agent-1"));
  assert(!tracker.Unregister("agent-1"));
}

} // namespace

int main() {
  TestIdleRequiresStart();
  TestIdleThresholdIsInclusive();
  TestActiveClaimsKeepClaimantBusy();
  TestActivityNeverMovesBackwards();
  TestIdleOrderIsOldestFirst();
  TestRebuildFromActiveClaims();

  std::cout << "claims_unit_activity_tracker: pass\n";
  return 0;
}
