#include "claim_service.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/activity/activity_tracker.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace claims::service {

namespace {

using model::ClaimStatus;

constexpr int kClaimAttempts = 8;

void ThrowIfDbError(const db::Result& result, const std::string& context, const std::optional<model::Claim>& snapshot = std::nullopt) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (db::IsContention(result.code)) {
    throw util::Conflict(message, snapshot);
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::ConstraintViolation:
      if (snapshot) throw util::InvalidTransition(message, snapshot);
      throw util::ValidationError(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ToString(result.code)) + ")");
  }
}

void AppendHistory(model::Claim& claim, ClaimStatus to, const std::string& actor, const std::string& reason, std::uint64_t now_ms,
                   const std::string& previous_claimant = {}) {
  claim.history.push_back({claim.status, to, actor, reason, now_ms, previous_claimant});
  claim.status = to;
}

void Heartbeat(model::Claim& claim, std::uint64_t now_ms) {
  claim.last_activity_at_ms = std::max(claim.last_activity_at_ms, now_ms);
  claim.updated_at_ms       = now_ms;
}

void RequireOwnedActive(const model::Claim& claim, const std::string& claimant_id, const char* op) {
  if (model::IsTerminal(claim.status)) {
    throw util::InvalidTransition(std::string(op) + " on " + std::string(model::ToString(claim.status)) + " claim " + claim.id, claim);
  }
  if (!claim.IsOwnedBy(claimant_id)) {
    throw util::NotOwner(claimant_id + " does not own claim " + claim.id, claim);
  }
  if (!model::IsActive(claim.status)) {
    throw util::InvalidTransition(std::string(op) + " on " + std::string(model::ToString(claim.status)) + " claim " + claim.id, claim);
  }
}

void RequireStatus(const model::Claim& claim, ClaimStatus expected, const char* op) {
  if (claim.status != expected) {
    throw util::InvalidTransition(std::string(op) + " requires " + std::string(model::ToString(expected)) + ", claim " + claim.id + " is " +
                                      std::string(model::ToString(claim.status)),
                                  claim);
  }
}

void ValidateClaimant(const model::Claimant& claimant) {
  if (claimant.id.empty()) throw util::ValidationError("claimant id is required");
  if (claimant.kind != model::ClaimantKind::kAgent && claimant.kind != model::ClaimantKind::kHuman) {
    throw util::ValidationError("unknown claimant kind for " + claimant.id);
  }
}

void ValidateNewClaim(const NewClaim& request) {
  if (request.title.empty()) throw util::ValidationError("claim title is required");
  if (request.domain.empty()) throw util::ValidationError("claim domain is required");
  if (static_cast<std::uint8_t>(request.type) > static_cast<std::uint8_t>(model::ClaimType::kTestReview)) {
    throw util::ValidationError("unknown claim type");
  }
  if (static_cast<std::uint8_t>(request.priority) > static_cast<std::uint8_t>(model::Priority::kP3)) {
    throw util::ValidationError("unknown claim priority");
  }
  if (static_cast<std::uint8_t>(request.severity) > static_cast<std::uint8_t>(model::Severity::kCritical)) {
    throw util::ValidationError("unknown claim severity");
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// Span + operation metrics around one public operation. Domain errors are expected outcomes and logged at debug.
template <typename Fn>
auto Instrument(const char* op, Fn&& fn) -> decltype(fn()) {
  observability::SpanScope span(op);
  const auto               started_at = std::chrono::steady_clock::now();
  auto&                    metrics    = observability::Metrics::Instance();

  try {
    auto result = fn();
    metrics.RecordOperation(op, "ok");
    metrics.ObserveOperationLatencyMs(op, ElapsedMs(started_at));
    return result;
  } catch (const util::ClaimError& e) {
    span.RecordException(e.what());
    CLAIMS_LOG_DEBUG("claim operation rejected", {observability::StringField("op", op), observability::StringField("kind", util::ToString(e.Kind())),
                                                  observability::StringField("error", e.what())});
    metrics.RecordOperation(op, util::ToString(e.Kind()));
    metrics.ObserveOperationLatencyMs(op, ElapsedMs(started_at));
    throw;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    CLAIMS_LOG_ERROR("claim operation failed", {observability::StringField("op", op), observability::StringField("error", e.what())});
    metrics.RecordOperation(op, "error");
    metrics.ObserveOperationLatencyMs(op, ElapsedMs(started_at));
    throw;
  }
}

} // namespace

ClaimService::ClaimService(std::shared_ptr<db::ClaimStore> store, std::shared_ptr<activity::ActivityTracker> tracker,
                           std::shared_ptr<events::EventBus> bus, std::shared_ptr<const util::TimeSource> clock, ServiceOptions options)
    : store_(std::move(store)), tracker_(std::move(tracker)), bus_(std::move(bus)), clock_(std::move(clock)), options_(options) {
  if (!store_) throw std::invalid_argument("ClaimService requires a claim store");
  if (!clock_) clock_ = std::make_shared<util::SystemTimeSource>();
}

std::uint64_t ClaimService::DefaultTtlFor(model::ClaimantKind kind) const {
  return kind == model::ClaimantKind::kHuman ? options_.human_ttl_ms : options_.agent_ttl_ms;
}

template <typename Check>
model::Claim ClaimService::Mutate(const std::string& id, const char* op, Check&& check, const db::Mutation& mutation, model::Claim* before) {
  auto current = store_->Get(id);
  if (!current) throw util::NotFound("claim not found: " + id);

  check(*current);

  model::Claim out;
  const auto   result = store_->Update(id, current->version, mutation, out);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::Conflict(std::string(op) + " lost a concurrent update on claim " + id, out);
  }
  ThrowIfDbError(result, std::string(op) + " " + id, current);

  if (before) *before = std::move(*current);
  return out;
}

void ClaimService::Publish(events::EventKind kind, const model::Claim& before, const model::Claim& after, const std::string& actor,
                           std::optional<std::string> reason, std::optional<std::string> handoff_id) {
  if (!bus_) return;

  events::ClaimEvent event;
  event.kind            = kind;
  event.claim_id        = after.id;
  event.actor           = actor;
  event.previous_status = before.status;
  event.new_status      = after.status;
  event.reason          = std::move(reason);
  event.timestamp_ms    = after.updated_at_ms;
  event.claim_version   = after.version;
  event.handoff_id      = std::move(handoff_id);
  if (before.claimant && !after.IsOwnedBy(before.claimant->id)) {
    event.previous_claimant = before.claimant->id;
  }
  bus_->Publish(event);
}

model::Claim ClaimService::CreateClaim(const NewClaim& request) {
  return Instrument("ClaimService.CreateClaim", [&] {
    ValidateNewClaim(request);

    const auto   now = clock_->NowMs();
    model::Claim claim;
    claim.id                  = util::GenerateId("claim");
    claim.type                = request.type;
    claim.priority            = request.priority;
    claim.severity            = request.severity;
    claim.domain              = request.domain;
    claim.title               = request.title;
    claim.description         = request.description;
    claim.metadata            = request.metadata;
    claim.tags                = request.tags;
    claim.correlation_id      = request.correlation_id.empty() ? util::GenerateId("corr") : request.correlation_id;
    claim.created_at_ms       = now;
    claim.updated_at_ms       = now;
    claim.last_activity_at_ms = now;

    ThrowIfDbError(store_->Create(claim), "create claim");
    ++counters_.created;

    CLAIMS_LOG_INFO("claim created", {observability::StringField("claim_id", claim.id), observability::StringField("type", model::ToString(claim.type)),
                                      observability::StringField("priority", model::ToString(claim.priority)),
                                      observability::StringField("domain", claim.domain)});
    Publish(events::EventKind::kCreated, claim, claim, request.actor);
    return claim;
  });
}

model::Claim ClaimService::Claim(const std::string& id, const model::Claimant& claimant, std::optional<std::uint64_t> ttl_override) {
  return Instrument("ClaimService.Claim", [&] {
    ValidateClaimant(claimant);
    if (ttl_override && *ttl_override == 0) throw util::ValidationError("ttl override must be positive");

    const auto now = clock_->NowMs();
    const auto ttl = ttl_override.value_or(DefaultTtlFor(claimant.kind));

    // A lost race against another claimant reports AlreadyClaimed; a lost race
    // that left the claim available (or a busy store) is retried.
    std::optional<model::Claim> current;
    model::Claim                out;
    for (int attempt = 1;; ++attempt) {
      current = store_->Get(id);
      if (!current) throw util::NotFound("claim not found: " + id);
      if (current->status != ClaimStatus::kAvailable) {
        throw util::AlreadyClaimed("claim " + id + " is " + std::string(model::ToString(current->status)), current);
      }

      const auto result = store_->Update(
          id, current->version,
          [&](model::Claim& c) {
            AppendHistory(c, ClaimStatus::kClaimed, claimant.id, "claim", now);
            c.claimant      = claimant;
            c.claimed_at_ms = now;
            c.ttl_ms        = ttl;
            c.blocked_reason.clear();
            Heartbeat(c, now);
          },
          out);
      if (result) break;

      if (result.code == db::ErrorCode::Conflict && out.status != ClaimStatus::kAvailable) {
        throw util::AlreadyClaimed("claim " + id + " was claimed concurrently", out);
      }
      if (!db::IsContention(result.code) || attempt >= kClaimAttempts) {
        ThrowIfDbError(result, "claim " + id, current);
      }
    }

    ++counters_.claimed;
    if (tracker_) tracker_->OnClaimAcquired(claimant, now);

    CLAIMS_LOG_INFO("claim acquired", {observability::StringField("claim_id", id), observability::StringField("claimant", claimant.id),
                                       observability::CountField("ttl_ms", ttl)});
    Publish(events::EventKind::kClaimed, *current, out, claimant.id);
    return out;
  });
}

model::Claim ClaimService::Touch(const std::string& id, const std::string& claimant_id) {
  return Instrument("ClaimService.Touch", [&] {
    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "touch",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "touch");
        },
        [now](model::Claim& c) {
          Heartbeat(c, now);
        },
        &before);

    if (tracker_) tracker_->RecordActivity(*out.claimant, now);
    Publish(events::EventKind::kTouched, before, out, claimant_id);
    return out;
  });
}

model::Claim ClaimService::StartWork(const std::string& id, const std::string& claimant_id) {
  return Instrument("ClaimService.StartWork", [&] {
    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "start-work",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "start-work");
          RequireStatus(c, ClaimStatus::kClaimed, "start-work");
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kInProgress, claimant_id, "start-work", now);
          Heartbeat(c, now);
        },
        &before);

    if (tracker_) tracker_->RecordActivity(*out.claimant, now);
    Publish(events::EventKind::kStatusChanged, before, out, claimant_id);
    return out;
  });
}

model::Claim ClaimService::Block(const std::string& id, const std::string& claimant_id, const std::string& reason) {
  return Instrument("ClaimService.Block", [&] {
    if (reason.empty()) throw util::ValidationError("block reason is required");

    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "block",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "block");
          RequireStatus(c, ClaimStatus::kInProgress, "block");
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kBlocked, claimant_id, reason, now);
          c.blocked_reason = reason;
          Heartbeat(c, now);
        },
        &before);

    if (tracker_) tracker_->RecordActivity(*out.claimant, now);
    Publish(events::EventKind::kStatusChanged, before, out, claimant_id, reason);
    return out;
  });
}

model::Claim ClaimService::Unblock(const std::string& id, const std::string& claimant_id) {
  return Instrument("ClaimService.Unblock", [&] {
    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "unblock",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "unblock");
          RequireStatus(c, ClaimStatus::kBlocked, "unblock");
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kInProgress, claimant_id, "unblock", now);
          c.blocked_reason.clear();
          Heartbeat(c, now);
        },
        &before);

    if (tracker_) tracker_->RecordActivity(*out.claimant, now);
    Publish(events::EventKind::kStatusChanged, before, out, claimant_id);
    return out;
  });
}

model::Claim ClaimService::Complete(const std::string& id, const std::string& claimant_id, const model::ClaimResult& result) {
  return Instrument("ClaimService.Complete", [&] {
    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "complete",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "complete");
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kCompleted, claimant_id, result.success ? "completed" : "completed-unsuccessfully", now);
          c.result = result;
          c.blocked_reason.clear();
          Heartbeat(c, now);
        },
        &before);

    ++counters_.completed;
    if (tracker_) {
      tracker_->OnClaimReleased(claimant_id);
      tracker_->RecordActivity(*out.claimant, now);
    }

    CLAIMS_LOG_INFO("claim completed", {observability::StringField("claim_id", id), observability::StringField("claimant", claimant_id),
                                        observability::BoolField("success", result.success)});
    Publish(events::EventKind::kCompleted, before, out, claimant_id, result.summary.empty() ? std::nullopt : std::optional(result.summary));
    return out;
  });
}

model::Claim ClaimService::Release(const std::string& id, const std::string& claimant_id) {
  return Instrument("ClaimService.Release", [&] {
    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "release",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "release");
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kAvailable, claimant_id, "release", now);
          c.previous_claimants.push_back(*c.claimant);
          c.claimant.reset();
          c.blocked_reason.clear();
          Heartbeat(c, now);
        },
        &before);

    ++counters_.released;
    if (tracker_) {
      tracker_->OnClaimReleased(claimant_id);
      tracker_->RecordActivity(*before.claimant, now);
    }

    CLAIMS_LOG_INFO("claim released", {observability::StringField("claim_id", id), observability::StringField("claimant", claimant_id)});
    Publish(events::EventKind::kReleased, before, out, claimant_id);
    return out;
  });
}

AbandonResult ClaimService::Abandon(const std::string& id, const std::string& claimant_id, const std::string& reason) {
  auto abandoned = Instrument("ClaimService.Abandon", [&] {
    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "abandon",
        [&](const model::Claim& c) {
          RequireOwnedActive(c, claimant_id, "abandon");
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kAbandoned, claimant_id, reason.empty() ? "abandoned" : reason, now);
          c.blocked_reason.clear();
          Heartbeat(c, now);
        },
        &before);

    ++counters_.abandoned;
    if (tracker_) {
      tracker_->OnClaimReleased(claimant_id);
      tracker_->RecordActivity(*out.claimant, now);
    }

    CLAIMS_LOG_INFO("claim abandoned", {observability::StringField("claim_id", id), observability::StringField("claimant", claimant_id),
                                        observability::StringField("reason", reason)});
    Publish(events::EventKind::kAbandoned, before, out, claimant_id, reason.empty() ? std::nullopt : std::optional(reason));
    return out;
  });

  AbandonResult result;
  result.abandoned = std::move(abandoned);
  if (!options_.requeue_on_abandon) return result;

  NewClaim requeue;
  requeue.type           = result.abandoned.type;
  requeue.priority       = result.abandoned.priority;
  requeue.severity       = result.abandoned.severity;
  requeue.domain         = result.abandoned.domain;
  requeue.title          = result.abandoned.title;
  requeue.description    = result.abandoned.description;
  requeue.metadata       = result.abandoned.metadata;
  requeue.tags           = result.abandoned.tags;
  requeue.correlation_id = result.abandoned.correlation_id;
  requeue.actor          = claimant_id;
  result.requeued        = CreateClaim(requeue);
  return result;
}

model::Claim ClaimService::EscalatePriority(const std::string& id, model::Priority new_priority, const std::string& actor) {
  return Instrument("ClaimService.EscalatePriority", [&] {
    if (static_cast<std::uint8_t>(new_priority) > static_cast<std::uint8_t>(model::Priority::kP3)) {
      throw util::ValidationError("unknown claim priority");
    }

    const auto   now = clock_->NowMs();
    model::Claim before;
    auto         out = Mutate(
        id, "escalate",
        [&](const model::Claim& c) {
          if (model::IsTerminal(c.status)) {
            throw util::InvalidTransition("cannot escalate " + std::string(model::ToString(c.status)) + " claim " + id, c);
          }
          if (!model::IsHigherPriority(new_priority, c.priority)) {
            throw util::ValidationError("priority " + std::string(model::ToString(new_priority)) + " is not higher than " +
                                        std::string(model::ToString(c.priority)));
          }
        },
        [&](model::Claim& c) {
          c.priority      = new_priority;
          c.updated_at_ms = now;
        },
        &before);

    Publish(events::EventKind::kPriorityEscalated, before, out, actor,
            std::string(model::ToString(before.priority)) + "->" + std::string(model::ToString(out.priority)));
    return out;
  });
}

model::Claim ClaimService::EscalatePriority(const std::string& id) {
  const auto current = GetClaim(id);
  if (current.priority == model::Priority::kP0) {
    throw util::InvalidTransition("claim " + id + " is already at p0", current);
  }
  return EscalatePriority(id, static_cast<model::Priority>(static_cast<std::uint8_t>(current.priority) - 1));
}

ExpirySweepReport ClaimService::ExpireStale(std::uint64_t now_ms, const runtime::CycleContext* ctx) {
  observability::SpanScope span("ClaimService.ExpireStale");
  ExpirySweepReport        report;

  const auto stale = store_->FindStale(now_ms);
  for (const auto& claim : stale) {
    if (ctx && ctx->ShouldStop()) {
      report.interrupted = true;
      break;
    }
    ++report.scanned;

    const auto kind   = claim.claimant ? claim.claimant->kind : model::ClaimantKind::kAgent;
    const auto action = kind == model::ClaimantKind::kHuman ? options_.human_expiry : options_.agent_expiry;
    const auto target = action == ExpiryAction::kRequeue ? ClaimStatus::kAvailable : ClaimStatus::kExpired;

    model::Claim out;
    db::Result   result;
    try {
      result = store_->Update(claim.id, claim.version,
                              [&](model::Claim& c) {
                                AppendHistory(c, target, "system", "ttl-expired", now_ms);
                                if (target == ClaimStatus::kAvailable && c.claimant) {
                                  c.previous_claimants.push_back(*c.claimant);
                                  c.claimant.reset();
                                }
                                c.blocked_reason.clear();
                                c.updated_at_ms = now_ms;
                              },
                              out);
    } catch (const std::exception& e) {
      result = db::Result::Err(db::ErrorCode::InternalError, e.what());
    }

    if (db::IsContention(result.code)) {
      ++report.conflicts;
      CLAIMS_LOG_DEBUG("expiry skipped, claim changed", {observability::StringField("claim_id", claim.id)});
      continue;
    }
    if (!result) {
      ++report.errors;
      CLAIMS_LOG_WARN("expiry failed", {observability::StringField("claim_id", claim.id), observability::StringField("error", result.message)});
      continue;
    }

    if (target == ClaimStatus::kAvailable) {
      ++report.requeued;
      observability::Metrics::Instance().AddTransitions("requeued");
    } else {
      ++report.expired;
      observability::Metrics::Instance().AddTransitions("expired");
    }
    ++counters_.expired;
    if (tracker_ && claim.claimant) tracker_->OnClaimReleased(claim.claimant->id);

    CLAIMS_LOG_INFO("claim expired", {observability::StringField("claim_id", claim.id),
                                      observability::StringField("claimant", claim.claimant ? claim.claimant->id : ""),
                                      observability::StringField("action", ToString(action))});
    Publish(events::EventKind::kExpired, claim, out, "system", std::string("ttl-expired"));
  }

  span.SetAttribute("scanned", static_cast<std::int64_t>(report.scanned));
  span.SetAttribute("conflicts", static_cast<std::int64_t>(report.conflicts));
  return report;
}

model::Claim ClaimService::Steal(const std::string& id, const model::Claimant& new_claimant, const std::string& reason) {
  return Instrument("ClaimService.Steal", [&] {
    ValidateClaimant(new_claimant);

    const auto   now = clock_->NowMs();
    const auto   ttl = DefaultTtlFor(new_claimant.kind);
    model::Claim before;
    auto         out = Mutate(
        id, "steal",
        [&](const model::Claim& c) {
          if (!model::IsStaleAt(c, now)) {
            throw util::InvalidTransition("claim " + id + " is not stale", c);
          }
          if (c.IsOwnedBy(new_claimant.id)) {
            throw util::ValidationError("claimant " + new_claimant.id + " already owns claim " + id);
          }
          if (options_.max_steal_count > 0 && c.steal_count >= options_.max_steal_count) {
            throw util::InvalidTransition("claim " + id + " reached the steal limit", c);
          }
        },
        [&](model::Claim& c) {
          AppendHistory(c, ClaimStatus::kClaimed, new_claimant.id, reason, now, c.claimant->id);
          c.previous_claimants.push_back(*c.claimant);
          c.claimant      = new_claimant;
          c.claimed_at_ms = now;
          c.ttl_ms        = ttl;
          c.blocked_reason.clear();
          ++c.steal_count;
          Heartbeat(c, now);
        },
        &before);

    ++counters_.stolen;
    observability::Metrics::Instance().AddTransitions("stolen");
    if (tracker_) {
      tracker_->OnClaimReleased(before.claimant->id);
      tracker_->OnClaimAcquired(new_claimant, now);
    }

    CLAIMS_LOG_INFO("claim stolen", {observability::StringField("claim_id", id), observability::StringField("from", before.claimant->id),
                                     observability::StringField("to", new_claimant.id), observability::StringField("reason", reason)});
    Publish(events::EventKind::kStolen, before, out, new_claimant.id, reason);
    return out;
  });
}

model::Claim ClaimService::TransferOwnership(const std::string& id, const std::string& from_claimant_id, const model::Claimant& new_claimant,
                                             const std::string& note, const std::optional<std::string>& handoff_id) {
  return Instrument("ClaimService.TransferOwnership", [&] {
    ValidateClaimant(new_claimant);

    const auto   now = clock_->NowMs();
    const auto   ttl = DefaultTtlFor(new_claimant.kind);
    model::Claim before;
    auto         out = Mutate(
        id, "transfer",
        [&](const model::Claim& c) {
          if (!model::IsActive(c.status)) {
            throw util::InvalidTransition("cannot hand off " + std::string(model::ToString(c.status)) + " claim " + id, c);
          }
          if (!c.IsOwnedBy(from_claimant_id)) {
            throw util::ClaimNotOwnedByRequester(from_claimant_id + " no longer owns claim " + id, c);
          }
        },
        [&](model::Claim& c) {
          AppendHistory(c, c.status, new_claimant.id, note.empty() ? "handoff" : "handoff: " + note, now, c.claimant->id);
          c.previous_claimants.push_back(*c.claimant);
          c.claimant      = new_claimant;
          c.claimed_at_ms = now;
          c.ttl_ms        = ttl;
          Heartbeat(c, now);
        },
        &before);

    ++counters_.handed_off;
    if (tracker_) {
      tracker_->OnClaimReleased(from_claimant_id);
      tracker_->OnClaimAcquired(new_claimant, now);
    }

    CLAIMS_LOG_INFO("claim handed off", {observability::StringField("claim_id", id), observability::StringField("from", from_claimant_id),
                                         observability::StringField("to", new_claimant.id)});
    Publish(events::EventKind::kHandoff, before, out, new_claimant.id, note, handoff_id);
    return out;
  });
}

model::Claim ClaimService::GetClaim(const std::string& id) const {
  auto claim = store_->Get(id);
  if (!claim) throw util::NotFound("claim not found: " + id);
  return *claim;
}

std::vector<model::Claim> ClaimService::FindClaims(const db::ClaimFilter& filter) const {
  return store_->List(filter);
}

std::vector<model::Claim> ClaimService::FindStale(std::uint64_t now_ms) const {
  return store_->FindStale(now_ms);
}

std::vector<model::Claim> ClaimService::GetAvailableForClaimant(const model::Claimant& claimant, std::size_t limit) const {
  db::ClaimFilter filter;
  filter.status = ClaimStatus::kAvailable;
  filter.limit  = limit;
  if (claimant.IsAgent()) filter.domain = claimant.domain;
  return store_->List(filter);
}

ServiceMetrics ClaimService::GetMetrics() const {
  ServiceMetrics out;
  out.created    = counters_.created.load();
  out.claimed    = counters_.claimed.load();
  out.completed  = counters_.completed.load();
  out.released   = counters_.released.load();
  out.abandoned  = counters_.abandoned.load();
  out.expired    = counters_.expired.load();
  out.stolen     = counters_.stolen.load();
  out.handed_off = counters_.handed_off.load();
  return out;
}

} // namespace claims::service
