#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/claim_store.hpp"
#include "internal/events/claim_event.hpp"
#include "internal/model/claim.hpp"
#include "internal/runtime/cycle_context.hpp"
#include "internal/util/time.hpp"
#include "service_options.hpp"

namespace claims::activity {
class ActivityTracker;
}
namespace claims::events {
class EventBus;
}

namespace claims::service {

// Producer input for CreateClaim.
struct NewClaim {
  model::ClaimType         type     = model::ClaimType::kCoverageGap;
  model::Priority          priority = model::Priority::kP2;
  model::Severity          severity = model::Severity::kUnspecified;
  std::string              domain;
  std::string              title;
  std::string              description;
  std::string              metadata;
  std::vector<std::string> tags;
  std::string              correlation_id; // generated when empty
  std::string              actor = "producer";
};

struct AbandonResult {
  model::Claim                abandoned;
  std::optional<model::Claim> requeued;
};

struct ExpirySweepReport {
  std::size_t scanned   = 0;
  std::size_t expired   = 0;
  std::size_t requeued  = 0;
  std::size_t conflicts = 0;
  std::size_t errors    = 0;
  bool        interrupted = false;
  bool        skipped     = false; // another sweep was running
};

struct ServiceMetrics {
  std::uint64_t created    = 0;
  std::uint64_t claimed    = 0;
  std::uint64_t completed  = 0;
  std::uint64_t released   = 0;
  std::uint64_t abandoned  = 0;
  std::uint64_t expired    = 0;
  std::uint64_t stolen     = 0;
  std::uint64_t handed_off = 0;
};

/*
  ClaimService

  Enforces the claim state machine on top of a ClaimStore.

  Every mutating operation is exactly one ClaimStore::Update (or Create)
  against the version that was read, followed by one published event. The
  service never retries; a lost compare-and-set surfaces as
  util::Conflict carrying the current claim.

  Errors are thrown as util::ClaimError subclasses.
*/
class ClaimService {
 public:
  ClaimService(std::shared_ptr<db::ClaimStore> store, std::shared_ptr<activity::ActivityTracker> tracker,
               std::shared_ptr<events::EventBus> bus, std::shared_ptr<const util::TimeSource> clock, ServiceOptions options = {});

  model::Claim CreateClaim(const NewClaim& request);

  // ttl_override, when set, replaces the per-kind default.
  model::Claim Claim(const std::string& id, const model::Claimant& claimant, std::optional<std::uint64_t> ttl_override = std::nullopt);

  model::Claim Touch(const std::string& id, const std::string& claimant_id);
  model::Claim StartWork(const std::string& id, const std::string& claimant_id);
  model::Claim Block(const std::string& id, const std::string& claimant_id, const std::string& reason);
  model::Claim Unblock(const std::string& id, const std::string& claimant_id);
  model::Claim Complete(const std::string& id, const std::string& claimant_id, const model::ClaimResult& result);
  model::Claim Release(const std::string& id, const std::string& claimant_id);
  AbandonResult Abandon(const std::string& id, const std::string& claimant_id, const std::string& reason);

  model::Claim EscalatePriority(const std::string& id, model::Priority new_priority, const std::string& actor = "system");
  // Raises the priority by one tier.
  model::Claim EscalatePriority(const std::string& id);

  ExpirySweepReport ExpireStale(std::uint64_t now_ms, const runtime::CycleContext* ctx = nullptr);

  // Privileged: reassigns a claim that is stale right now.
  model::Claim Steal(const std::string& id, const model::Claimant& new_claimant, const std::string& reason = "stale");

  // Consensual transfer; the claim keeps its status.
  model::Claim TransferOwnership(const std::string& id, const std::string& from_claimant_id, const model::Claimant& new_claimant,
                                 const std::string& note, const std::optional<std::string>& handoff_id = std::nullopt);

  model::Claim              GetClaim(const std::string& id) const;
  std::vector<model::Claim> FindClaims(const db::ClaimFilter& filter) const;
  std::vector<model::Claim> FindStale(std::uint64_t now_ms) const;
  // Agents see their own domain, humans see every domain.
  std::vector<model::Claim> GetAvailableForClaimant(const model::Claimant& claimant, std::size_t limit = 0) const;
  ServiceMetrics            GetMetrics() const;

  std::uint64_t DefaultTtlFor(model::ClaimantKind kind) const;

  const ServiceOptions& Options() const {
    return options_;
  }

  std::uint64_t NowMs() const {
    return clock_->NowMs();
  }

 private:
  // Reads the claim, runs `check` against the snapshot, then commits `mutation` at that version.
  template <typename Check>
  model::Claim Mutate(const std::string& id, const char* op, Check&& check, const db::Mutation& mutation, model::Claim* before = nullptr);

  void Publish(events::EventKind kind, const model::Claim& before, const model::Claim& after, const std::string& actor,
               std::optional<std::string> reason = std::nullopt, std::optional<std::string> handoff_id = std::nullopt);

  std::shared_ptr<db::ClaimStore>            store_;
  std::shared_ptr<activity::ActivityTracker> tracker_;
  std::shared_ptr<events::EventBus>          bus_;
  std::shared_ptr<const util::TimeSource>    clock_;
  ServiceOptions                             options_;

  struct Counters {
    std::atomic<std::uint64_t> created{0};
    std::atomic<std::uint64_t> claimed{0};
    std::atomic<std::uint64_t> completed{0};
    std::atomic<std::uint64_t> released{0};
    std::atomic<std::uint64_t> abandoned{0};
    std::atomic<std::uint64_t> expired{0};
    std::atomic<std::uint64_t> stolen{0};
    std::atomic<std::uint64_t> handed_off{0};
  };
  Counters counters_;
};

} // namespace claims::service
