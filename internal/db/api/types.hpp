#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/claim.hpp"

namespace claims::db {

struct ClaimFilter {
  std::optional<model::ClaimStatus> status;
  std::optional<std::string>        domain;
  std::optional<model::Priority>    priority;
  std::optional<std::string>        claimant_id;
  std::optional<model::ClaimType>   type;
  std::vector<std::string>          tags; // every tag must be present
  std::size_t                       limit = 0; // 0 = unlimited
};

// Applied to a private copy of the stored claim inside Update().
using Mutation = std::function<void(model::Claim&)>;

bool Matches(const model::Claim& claim, const ClaimFilter& filter);

// priority descending (p0 first), then created_at ascending, then id.
bool ListOrder(const model::Claim& lhs, const model::Claim& rhs);

void SortAndLimit(std::vector<model::Claim>& claims, std::size_t limit);

} // namespace claims::db
