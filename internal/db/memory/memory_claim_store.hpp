#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/claim_store.hpp"

namespace claims::db::memory {

/*
  Volatile ClaimStore.

  One mutex guards the whole map; Update() runs check, mutation and
  commit under it, which makes every update a compare-and-set.
*/
class MemoryClaimStore final : public db::ClaimStore {
public:
  MemoryClaimStore();

  Result Create(model::Claim& claim) override;
  std::optional<model::Claim> Get(const std::string& id) override;
  Result Update(const std::string& id, uint64_t expected_version, const Mutation& mutation,
                model::Claim& out) override;
  std::vector<model::Claim> List(const ClaimFilter& filter) override;
  std::vector<model::Claim> FindStale(uint64_t now_ms) override;
  std::size_t Count(const ClaimFilter& filter) override;
  Result Delete(const std::string& id) override;

private:
  std::mutex mutex_;
  std::unordered_map<std::string, model::Claim> claims_;
};

}
