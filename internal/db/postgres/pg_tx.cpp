#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace claims::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*conn_);
  open_ = true;
}

PgTransaction::~PgTransaction() {
  if (open_) {
    try {
      work_->abort();
    } catch (const std::exception& e) {
      CLAIMS_LOG_WARN("postgres rollback failed", {claims::observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before its connection is handed back
  work_.reset();
}

void PgTransaction::Commit() {
  work_->commit();
  open_ = false;
}

} // namespace claims::db::postgres
