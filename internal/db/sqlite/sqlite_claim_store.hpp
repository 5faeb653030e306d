#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/claim_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace claims::db::sqlite {

/*
  SQLite-backed ClaimStore.

  Compare-and-set is the `WHERE id=? AND version=?` guard on the claim
  row inside a BEGIN IMMEDIATE transaction, so it also holds between
  processes sharing the database file. The connection is shared, so calls
  from this process are serialized.
*/
class SqliteClaimStore final : public db::ClaimStore {
public:
  explicit SqliteClaimStore(std::shared_ptr<SqliteDB> db);

  Result Create(model::Claim& claim) override;
  std::optional<model::Claim> Get(const std::string& id) override;
  Result Update(const std::string& id, uint64_t expected_version, const Mutation& mutation,
                model::Claim& out) override;
  std::vector<model::Claim> List(const ClaimFilter& filter) override;
  std::vector<model::Claim> FindStale(uint64_t now_ms) override;
  std::size_t Count(const ClaimFilter& filter) override;
  Result Delete(const std::string& id) override;

private:
  std::optional<model::Claim> Load(const std::string& id);
  std::vector<model::Claim> Query(const char* sql, uint64_t now_ms);
  void LoadChildren(model::Claim& claim);
  void WriteChildren(const model::Claim& before, const model::Claim& after);

  std::shared_ptr<SqliteDB> db_;
  std::mutex mutex_;
};

}
