#include "factory.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_claim_store.hpp"
#include "internal/observability/logging.hpp"
#if CLAIMS_DB_SQLITE
#include "internal/db/sqlite/sqlite_claim_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if CLAIMS_DB_POSTGRES
#include "internal/db/postgres/pg_claim_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace claims::factory {

std::shared_ptr<db::ClaimStore> BuildStore(const claims::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CLAIMS_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) throw std::invalid_argument("database.sqlite.path is required");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), !sqlite.has_wal_mode() || sqlite.wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    CLAIMS_LOG_INFO("claim store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteClaimStore>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CLAIMS_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? 16u : postgres.max_connections();
    auto        pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    db::postgres::BootstrapSchema(pool);
    CLAIMS_LOG_INFO("claim store ready", {observability::StringField("backend", "postgres"),
                                          observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgClaimStore>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CLAIMS_LOG_INFO("claim store ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryClaimStore>();
}

Application Build(const claims::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock) {
  Application app;

  app.clock   = clock ? std::move(clock) : std::make_shared<util::SystemTimeSource>();
  app.store   = BuildStore(config);
  app.bus     = std::make_shared<events::EventBus>();
  app.tracker = std::make_shared<activity::ActivityTracker>();
  app.service = std::make_shared<service::ClaimService>(app.store, app.tracker, app.bus, app.clock, config::ToServiceOptions(config));

  if (!config.events().audit_log_path().empty()) {
    app.audit_log = std::make_unique<events::AuditLogWriter>(config.events().audit_log_path());
    app.audit_log->Attach(app.bus);
  }

  app.handoffs = std::make_unique<handoff::HandoffManager>(app.service, app.bus);

  // Claims held before a restart still count against their claimants.
  std::vector<model::Claim> active;
  for (auto status : {model::ClaimStatus::kClaimed, model::ClaimStatus::kInProgress, model::ClaimStatus::kBlocked}) {
    db::ClaimFilter filter;
    filter.status = status;
    auto claims   = app.service->FindClaims(filter);
    active.insert(active.end(), std::make_move_iterator(claims.begin()), std::make_move_iterator(claims.end()));
  }
  app.tracker->Rebuild(active, app.clock->NowMs());
  app.tracker->Start();

  app.coordinator = std::make_unique<coordination::WorkStealingCoordinator>(app.service, app.tracker, config::ToWorkStealingOptions(config));
  app.sweeper     = std::make_unique<coordination::ExpirySweeper>(app.service, config::ToExpiryOptions(config));

  return app;
}

void Application::Start() {
  if (sweeper) sweeper->Start();
  if (coordinator) coordinator->Start();
}

void Application::Stop() {
  if (coordinator) coordinator->Stop();
  if (sweeper) sweeper->Stop();
  if (audit_log) audit_log->Detach();
}

} // namespace claims::factory
