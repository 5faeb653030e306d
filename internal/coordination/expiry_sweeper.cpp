#include "expiry_sweeper.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace claims::coordination {

ExpirySweeper::ExpirySweeper(std::shared_ptr<service::ClaimService> service, ExpiryOptions options)
    : service_(std::move(service)), options_(options) {
  task_ = std::make_unique<runtime::PeriodicTask>("expiry-sweep", options_.interval, options_.sweep_deadline,
                                                  [this](const runtime::CycleContext& ctx) {
                                                    SweepOnce(&ctx);
                                                  });
}

ExpirySweeper::~ExpirySweeper() {
  Stop();
}

void ExpirySweeper::Start() {
  if (!options_.enabled) {
    CLAIMS_LOG_INFO("expiry sweep disabled");
    return;
  }
  task_->Start();
}

void ExpirySweeper::Stop() {
  task_->Stop();
}

bool ExpirySweeper::IsRunning() const {
  return task_->IsRunning();
}

service::ExpirySweepReport ExpirySweeper::SweepOnce(const runtime::CycleContext* ctx) {
  if (in_flight_.exchange(true)) {
    service::ExpirySweepReport skipped;
    skipped.skipped = true;
    return skipped;
  }

  const auto                 started_at = std::chrono::steady_clock::now();
  service::ExpirySweepReport report;
  try {
    report = service_->ExpireStale(service_->NowMs(), ctx);
  } catch (const std::exception& e) {
    in_flight_ = false;
    CLAIMS_LOG_ERROR("expiry sweep failed", {observability::StringField("error", e.what())});
    throw;
  }
  in_flight_ = false;

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  observability::Metrics::Instance().ObserveCycle("expiry", elapsed_ms, report.interrupted);

  if (report.expired + report.requeued + report.conflicts + report.errors > 0 || report.interrupted) {
    CLAIMS_LOG_INFO("expiry sweep finished", {observability::CountField("scanned", report.scanned),
                                              observability::CountField("expired", report.expired),
                                              observability::CountField("requeued", report.requeued),
                                              observability::CountField("conflicts", report.conflicts),
                                              observability::CountField("errors", report.errors),
                                              observability::BoolField("interrupted", report.interrupted)});
  }
  return report;
}

} // namespace claims::coordination
