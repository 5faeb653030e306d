#include "sqlite_schema.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace claims::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS claims (id TEXT PRIMARY KEY, type TEXT NOT NULL, status TEXT NOT NULL, priority TEXT NOT NULL, severity TEXT NOT NULL, "
      "domain TEXT NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL, metadata TEXT NOT NULL, "
      "claimant_id TEXT, claimant_kind TEXT, claimant_name TEXT, claimant_domain TEXT, claimant_agent_type TEXT, "
      "claimed_at_ms INTEGER NOT NULL, last_activity_at_ms INTEGER NOT NULL, ttl_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, steal_count INTEGER NOT NULL, correlation_id TEXT NOT NULL, blocked_reason TEXT NOT NULL, "
      "result_success INTEGER, result_summary TEXT, result_artifacts TEXT, result_time_spent_ms INTEGER, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS claims_status_idx ON claims(status, priority, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS claim_history (claim_id TEXT NOT NULL, seq INTEGER NOT NULL, from_status TEXT NOT NULL, to_status TEXT NOT NULL, "
      "actor TEXT NOT NULL, reason TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, previous_claimant TEXT NOT NULL DEFAULT '', "
      "PRIMARY KEY (claim_id, seq), "
      "FOREIGN KEY(claim_id) REFERENCES claims(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS claim_previous_claimants (claim_id TEXT NOT NULL, seq INTEGER NOT NULL, claimant_id TEXT NOT NULL, kind TEXT NOT NULL, "
      "name TEXT NOT NULL, domain TEXT NOT NULL, agent_type TEXT NOT NULL, PRIMARY KEY (claim_id, seq), "
      "FOREIGN KEY(claim_id) REFERENCES claims(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS claim_tags (claim_id TEXT NOT NULL, seq INTEGER NOT NULL, tag TEXT NOT NULL, PRIMARY KEY (claim_id, seq), "
      "FOREIGN KEY(claim_id) REFERENCES claims(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS claims_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  const auto current = ReadSchemaVersion(db);
  if (current > kSchemaVersion) {
    throw std::runtime_error("claim database schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(kSchemaVersion));
  }
  if (current < kSchemaVersion) {
    const auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    SqliteStatement st(db.Handle(), "INSERT INTO claims_schema_migrations(version, applied_at_ms) VALUES(?,?);");
    st.BindI64(1, kSchemaVersion);
    st.BindI64(2, now_ms);
    st.Run();
  }

  db.Exec("SELECT id,status,version,last_activity_at_ms,ttl_ms FROM claims LIMIT 1;");
  db.Exec("SELECT claim_id,seq,from_status,to_status,actor,reason,timestamp_ms,previous_claimant FROM claim_history LIMIT 1;");
}

int ReadSchemaVersion(SqliteDB& db) {
  SqliteStatement st(db.Handle(), "SELECT COALESCE(MAX(version), 0) FROM claims_schema_migrations;");
  if (!st.Step()) return 0;
  return static_cast<int>(st.ColU64(0));
}

} // namespace claims::db::sqlite
