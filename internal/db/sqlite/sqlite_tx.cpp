#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace claims::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CLAIMS_LOG_WARN("sqlite rollback failed", {claims::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  open_ = false;
}

} // namespace claims::db::sqlite
