#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "pg_pool.hpp"

namespace claims::db::postgres {

/*
  One pqxx::work on a pooled connection.

  The connection goes back to the pool when the transaction is destroyed;
  an uncommitted work is aborted first.
*/
class PgTransaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction();

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit();

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              open_ = false;
};

} // namespace claims::db::postgres
