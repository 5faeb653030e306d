#include "work_stealing_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "internal/activity/activity_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/claim_service.hpp"
#include "internal/util/errors.hpp"

namespace claims::coordination {

namespace {

struct Candidate {
  model::Claim claim;
  bool         consumed = false;
};

std::uint64_t SilenceMs(const model::Claim& claim, std::uint64_t now_ms) {
  return now_ms > claim.last_activity_at_ms ? now_ms - claim.last_activity_at_ms : 0;
}

// Clears the single-flight flag on every exit path.
class InFlightGuard {
 public:
  explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~InFlightGuard() {
    flag_ = false;
  }

 private:
  std::atomic<bool>& flag_;
};

} // namespace

WorkStealingCoordinator::WorkStealingCoordinator(std::shared_ptr<service::ClaimService> service,
                                                 std::shared_ptr<activity::ActivityTracker> tracker, WorkStealingOptions options)
    : service_(std::move(service)), tracker_(std::move(tracker)), options_(options) {
  task_ = std::make_unique<runtime::PeriodicTask>("work-stealing", options_.interval, options_.cycle_deadline,
                                                  [this](const runtime::CycleContext& ctx) {
                                                    RunCycle(&ctx);
                                                  });
}

WorkStealingCoordinator::~WorkStealingCoordinator() {
  Stop();
}

void WorkStealingCoordinator::Start() {
  if (!options_.enabled) {
    CLAIMS_LOG_INFO("work stealing disabled");
    return;
  }
  task_->Start();
}

void WorkStealingCoordinator::Stop() {
  task_->Stop();
}

bool WorkStealingCoordinator::IsRunning() const {
  return task_->IsRunning();
}

CycleReport WorkStealingCoordinator::RunCycle(const runtime::CycleContext* ctx) {
  if (in_flight_.exchange(true)) {
    CLAIMS_LOG_DEBUG("work stealing cycle skipped, previous still running");
    CycleReport skipped;
    skipped.skipped = true;
    return skipped;
  }
  InFlightGuard guard(in_flight_);

  observability::SpanScope span("WorkStealingCoordinator.RunCycle");
  const auto               started_at = std::chrono::steady_clock::now();

  auto report = Execute(ctx);

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  observability::Metrics::Instance().ObserveCycle("work_stealing", elapsed_ms, report.interrupted);
  span.SetAttribute("steals", static_cast<std::int64_t>(report.steals.size()));
  span.SetAttribute("conflicts", static_cast<std::int64_t>(report.conflicts));

  if (!report.steals.empty() || report.failures > 0 || report.interrupted) {
    CLAIMS_LOG_INFO("work stealing cycle finished", {observability::CountField("idle", report.idle_claimants),
                                                     observability::CountField("stale", report.stale_candidates),
                                                     observability::CountField("steals", report.steals.size()),
                                                     observability::CountField("conflicts", report.conflicts),
                                                     observability::CountField("failures", report.failures),
                                                     observability::BoolField("interrupted", report.interrupted)});
  }
  return report;
}

CycleReport WorkStealingCoordinator::Execute(const runtime::CycleContext* ctx) {
  CycleReport report;
  report.now_ms  = service_->NowMs();
  const auto now = report.now_ms;

  const auto idle = tracker_->GetIdleClaimants(options_.idle_threshold_ms, now);
  report.idle_claimants = idle.size();
  if (idle.empty()) return report;

  std::vector<Candidate> candidates;
  for (auto& claim : service_->FindStale(now)) {
    if (!model::IsActive(claim.status)) continue;
    if (SilenceMs(claim, now) <= options_.stale_threshold_ms) continue;
    candidates.push_back({std::move(claim), false});
  }
  report.stale_candidates = candidates.size();
  if (candidates.empty()) return report;

  std::sort(candidates.begin(), candidates.end(), [now](const Candidate& lhs, const Candidate& rhs) {
    const auto& a = lhs.claim;
    const auto& b = rhs.claim;
    if (a.priority != b.priority) return model::IsHigherPriority(a.priority, b.priority);
    if (SilenceMs(a, now) != SilenceMs(b, now)) return SilenceMs(a, now) > SilenceMs(b, now);
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });

  const auto next_candidate = [&](const model::Claimant& claimant) -> Candidate* {
    for (auto& c : candidates) {
      if (!c.consumed && c.claim.domain == claimant.domain) return &c;
    }
    if (!options_.allow_cross_domain) return nullptr;
    for (auto& c : candidates) {
      if (!c.consumed) return &c;
    }
    return nullptr;
  };

  for (const auto& entry : idle) {
    if (options_.max_steals_per_cycle > 0 && report.steals.size() >= options_.max_steals_per_cycle) break;

    const auto& claimant = entry.claimant;
    bool        matched  = false;
    while (!matched) {
      if (ctx && ctx->ShouldStop()) {
        report.interrupted = true;
        return report;
      }

      auto* candidate = next_candidate(claimant);
      if (!candidate) break;
      candidate->consumed = true;

      const auto& claim = candidate->claim;
      try {
        service_->Steal(claim.id, claimant, "stale");
        report.steals.push_back({claim.id, claim.claimant ? claim.claimant->id : std::string{}, claimant.id, claim.domain != claimant.domain});
        matched = true;
      } catch (const util::Conflict&) {
        ++report.conflicts;
        CLAIMS_LOG_DEBUG("steal lost a race", {observability::StringField("claim_id", claim.id), observability::StringField("claimant", claimant.id)});
      } catch (const util::ClaimError& e) {
        ++report.failures;
        CLAIMS_LOG_WARN("steal rejected", {observability::StringField("claim_id", claim.id), observability::StringField("claimant", claimant.id),
                                           observability::StringField("kind", util::ToString(e.Kind())),
                                           observability::StringField("error", e.what())});
      } catch (const std::exception& e) {
        ++report.failures;
        CLAIMS_LOG_ERROR("steal failed", {observability::StringField("claim_id", claim.id), observability::StringField("claimant", claimant.id),
                                          observability::StringField("error", e.what())});
      }
    }
  }
  return report;
}

} // namespace claims::coordination
