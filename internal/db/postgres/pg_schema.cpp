#include "pg_schema.hpp"

#include <stdexcept>
#include <string>

namespace claims::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS claims (id TEXT PRIMARY KEY, type TEXT NOT NULL, status TEXT NOT NULL, priority TEXT NOT NULL, "
          "severity TEXT NOT NULL, domain TEXT NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL, metadata TEXT NOT NULL, "
          "claimant_id TEXT, claimant_kind TEXT, claimant_name TEXT, claimant_domain TEXT, claimant_agent_type TEXT, "
          "claimed_at_ms BIGINT NOT NULL, last_activity_at_ms BIGINT NOT NULL, ttl_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, "
          "updated_at_ms BIGINT NOT NULL, steal_count INTEGER NOT NULL, correlation_id TEXT NOT NULL, blocked_reason TEXT NOT NULL, "
          "result_success BOOLEAN, result_summary TEXT, result_artifacts TEXT, result_time_spent_ms BIGINT, version BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS claims_status_idx ON claims(status, priority, created_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS claim_history (claim_id TEXT NOT NULL REFERENCES claims(id) ON DELETE CASCADE, seq INTEGER NOT NULL, "
          "from_status TEXT NOT NULL, to_status TEXT NOT NULL, actor TEXT NOT NULL, reason TEXT NOT NULL, timestamp_ms BIGINT NOT NULL, "
          "previous_claimant TEXT NOT NULL DEFAULT '', PRIMARY KEY (claim_id, seq));");
  tx.exec("CREATE TABLE IF NOT EXISTS claim_previous_claimants (claim_id TEXT NOT NULL REFERENCES claims(id) ON DELETE CASCADE, "
          "seq INTEGER NOT NULL, claimant_id TEXT NOT NULL, kind TEXT NOT NULL, name TEXT NOT NULL, domain TEXT NOT NULL, "
          "agent_type TEXT NOT NULL, PRIMARY KEY (claim_id, seq));");
  tx.exec("CREATE TABLE IF NOT EXISTS claim_tags (claim_id TEXT NOT NULL REFERENCES claims(id) ON DELETE CASCADE, seq INTEGER NOT NULL, "
          "tag TEXT NOT NULL, PRIMARY KEY (claim_id, seq));");
  tx.exec("CREATE TABLE IF NOT EXISTS claims_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");

  const auto current = tx.exec("SELECT COALESCE(MAX(version), 0) FROM claims_schema_migrations;")[0][0].as<int>();
  if (current > kSchemaVersion) {
    throw std::runtime_error("claim database schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(kSchemaVersion));
  }
  if (current < kSchemaVersion) {
    tx.exec("INSERT INTO claims_schema_migrations(version) VALUES(" + std::to_string(kSchemaVersion) + ");");
  }

  tx.exec("SELECT id,status,version,last_activity_at_ms,ttl_ms FROM claims LIMIT 1;");
  tx.exec("SELECT claim_id,seq,from_status,to_status,actor,reason,timestamp_ms,previous_claimant FROM claim_history LIMIT 1;");
  tx.commit();
}

int ReadSchemaVersion(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  const auto version = tx.exec("SELECT COALESCE(MAX(version), 0) FROM claims_schema_migrations;")[0][0].as<int>();
  tx.commit();
  return version;
}

} // namespace claims::db::postgres
