#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/claim.hpp"

namespace claims::db {

/*
  ClaimStore abstraction.

  CRITICAL GUARANTEES:

  - Update() is the only way a stored claim changes
  - Update() is an atomic compare-and-set on Claim::version
  - Two updates from the same version: exactly one commits, the other
    observes Conflict and the current snapshot
  - Committed history is never rewritten; updates may only append
  - Status changes are limited to model::CanTransition()

  The store is the single source of truth for claim existence and
  exclusivity.
*/

class ClaimStore {
 public:
  virtual ~ClaimStore() = default;

  // Inserts a new claim in `available` at version 1.
  virtual Result Create(model::Claim& claim) = 0;

  virtual std::optional<model::Claim> Get(const std::string& id) = 0;

  // On OK `out` is the committed claim; on Conflict it is the current snapshot.
  virtual Result Update(const std::string& id, uint64_t expected_version, const Mutation& mutation, model::Claim& out) = 0;

  virtual std::vector<model::Claim> List(const ClaimFilter& filter) = 0;

  // Active claims with now_ms - last_activity_at_ms > ttl_ms.
  virtual std::vector<model::Claim> FindStale(uint64_t now_ms) = 0;

  virtual std::size_t Count(const ClaimFilter& filter) = 0;

  // Archival removal; the coordination core never deletes claims.
  virtual Result Delete(const std::string& id) = 0;
};

// Checks a mutated claim against the stored one. Shared by every backend.
Result ValidateMutation(const model::Claim& before, const model::Claim& after);

Result ValidateNewClaim(const model::Claim& claim);

} // namespace claims::db
