#include <array>
#include <cassert>
#include <iostream>

#include "internal/model/claim.hpp"
#include "internal/model/state_machine.hpp"

namespace {

using claims::model::CanTransition;
using claims::model::ClaimStatus;

constexpr std::array kAllStatuses = {ClaimStatus::kAvailable, ClaimStatus::kClaimed,  ClaimStatus::kInProgress, ClaimStatus::kBlocked,
                                     ClaimStatus::kCompleted, ClaimStatus::kReleased, ClaimStatus::kExpired,    ClaimStatus::kAbandoned};

void TestAvailableOnlyMovesToClaimed() {
  for (auto to : kAllStatuses) {
    assert(CanTransition(ClaimStatus::kAvailable, to) == (to == ClaimStatus::kClaimed));
  }
}

void TestTerminalStatusesAreFinal() {
  for (auto from : {ClaimStatus::kCompleted, ClaimStatus::kExpired, ClaimStatus::kAbandoned}) {
    assert(claims::model::IsTerminal(from));
    for (auto to : kAllStatuses) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestNothingEntersReleased() {
  for (auto from : kAllStatuses) {
    assert(!CanTransition(from, ClaimStatus::kReleased));
  }
  for (auto to : kAllStatuses) {
    assert(!CanTransition(ClaimStatus::kReleased, to));
  }
}

void TestActiveTransitions() {
  assert(CanTransition(ClaimStatus::kClaimed, ClaimStatus::kInProgress));
  assert(!CanTransition(ClaimStatus::kClaimed, ClaimStatus::kBlocked));
  assert(CanTransition(ClaimStatus::kInProgress, ClaimStatus::kBlocked));
  assert(CanTransition(ClaimStatus::kBlocked, ClaimStatus::kInProgress));

  for (auto from : {ClaimStatus::kClaimed, ClaimStatus::kInProgress, ClaimStatus::kBlocked}) {
    assert(CanTransition(from, ClaimStatus::kCompleted));
    assert(CanTransition(from, ClaimStatus::kAvailable));
    assert(CanTransition(from, ClaimStatus::kAbandoned));
    assert(CanTransition(from, ClaimStatus::kExpired));
    // steal resets to claimed, handoff keeps the status
    assert(CanTransition(from, ClaimStatus::kClaimed));
    assert(CanTransition(from, from));
  }
}

void TestStalenessBoundary() {
  using claims::model::IsStaleAt;
  assert(!IsStaleAt(ClaimStatus::kInProgress, 1000, 500, 1500));
  assert(IsStaleAt(ClaimStatus::kInProgress, 1000, 500, 1501));
  assert(!IsStaleAt(ClaimStatus::kAvailable, 1000, 500, 9000));
  assert(!IsStaleAt(ClaimStatus::kCompleted, 1000, 500, 9000));
  // a clock behind the last activity never reports staleness
  assert(!IsStaleAt(ClaimStatus::kClaimed, 5000, 0, 4000));
}

void TestPriorityOrdering() {
  using claims::model::IsHigherPriority;
  using claims::model::Priority;
  assert(IsHigherPriority(Priority::kP0, Priority::kP1));
  assert(!IsHigherPriority(Priority::kP2, Priority::kP2));
  assert(!IsHigherPriority(Priority::kP3, Priority::kP1));
}

void TestParsingMatchesNames() {
  for (auto status : kAllStatuses) {
    auto parsed = claims::model::ParseClaimStatus(claims::model::ToString(status));
    assert(parsed.has_value() && *parsed == status);
  }
  assert(claims::model::ParseClaimType("flaky-test") == claims::model::ClaimType::kFlakyTest);
  assert(claims::model::ParsePriority("p0") == claims::model::Priority::kP0);
  assert(claims::model::ParseClaimantKind("human") == claims::model::ClaimantKind::kHuman);
  assert(!claims::model::ParsePriority("p9").has_value());
  assert(!claims::model::ParseClaimStatus("in_progress").has_value());
}

} // namespace

int main() {
  TestAvailableOnlyMovesToClaimed();
  TestTerminalStatusesAreFinal();
  TestNothingEntersReleased();
  TestActiveTransitions();
  TestStalenessBoundary();
  TestPriorityOrdering();
  TestParsingMatchesNames();

  std::cout << "claims_unit_state_machine: pass\n";
  return 0;
}
