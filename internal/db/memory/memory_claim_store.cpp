#include "memory_claim_store.hpp"

#include <exception>

namespace claims::db::memory {

MemoryClaimStore::MemoryClaimStore() = default;

Result MemoryClaimStore::Create(model::Claim& claim) {
  if (auto r = ValidateNewClaim(claim); !r) return r;

  claim.status  = model::ClaimStatus::kAvailable;
  claim.version = 1;
  claim.history.clear();

  std::lock_guard lock(mutex_);
  if (claims_.contains(claim.id)) return Result::Err(ErrorCode::AlreadyExists, "claim already exists: " + claim.id);
  claims_[claim.id] = claim;
  return Result::Ok();
}

std::optional<model::Claim> MemoryClaimStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto it = claims_.find(id);
  if (it == claims_.end()) return std::nullopt;
  return it->second;
}

Result MemoryClaimStore::Update(const std::string& id, uint64_t expected_version, const Mutation& mutation, model::Claim& out) {
  std::lock_guard lock(mutex_);

  auto it = claims_.find(id);
  if (it == claims_.end()) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);

  if (it->second.version != expected_version) {
    out = it->second;
    return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");
  }

  model::Claim working = it->second;
  try {
    mutation(working);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  if (auto r = ValidateMutation(it->second, working); !r) return r;

  working.version = expected_version + 1;
  it->second      = working;
  out             = std::move(working);
  return Result::Ok();
}

std::vector<model::Claim> MemoryClaimStore::List(const ClaimFilter& filter) {
  std::vector<model::Claim> out;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, claim] : claims_) {
      if (Matches(claim, filter)) out.push_back(claim);
    }
  }
  SortAndLimit(out, filter.limit);
  return out;
}

std::vector<model::Claim> MemoryClaimStore::FindStale(uint64_t now_ms) {
  std::vector<model::Claim> out;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, claim] : claims_) {
      if (model::IsStaleAt(claim, now_ms)) out.push_back(claim);
    }
  }
  SortAndLimit(out, 0);
  return out;
}

std::size_t MemoryClaimStore::Count(const ClaimFilter& filter) {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (const auto& [_, claim] : claims_) {
    if (Matches(claim, filter)) ++count;
  }
  if (filter.limit > 0 && count > filter.limit) count = filter.limit;
  return count;
}

Result MemoryClaimStore::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);
  if (claims_.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);
  return Result::Ok();
}

} // namespace claims::db::memory
