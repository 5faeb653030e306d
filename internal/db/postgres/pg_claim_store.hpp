#pragma once

#include <memory>

#include "internal/db/api/claim_store.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace claims::db::postgres {

/*
  PostgreSQL ClaimStore.

  Update() locks the row with SELECT ... FOR UPDATE and writes with a
  version guard, so concurrent coordinators on other hosts see the same
  compare-and-set semantics as the in-process backends.
*/
class PgClaimStore final : public db::ClaimStore {
public:
  explicit PgClaimStore(std::shared_ptr<PgPool> pool);

  Result Create(model::Claim& claim) override;
  std::optional<model::Claim> Get(const std::string& id) override;
  Result Update(const std::string& id, uint64_t expected_version, const Mutation& mutation,
                model::Claim& out) override;
  std::vector<model::Claim> List(const ClaimFilter& filter) override;
  std::vector<model::Claim> FindStale(uint64_t now_ms) override;
  std::size_t Count(const ClaimFilter& filter) override;
  Result Delete(const std::string& id) override;

private:
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

}
