#pragma once

#include <string>
#include <vector>

#include "internal/model/claim.hpp"

namespace claims::db::codec {

/*
  Text encodings shared by the SQL-backed stores.

  Enumerations are stored by their canonical names; an unknown name in a
  row means the table was written by something else and is reported as
  corruption (std::runtime_error).
*/

model::ClaimType    DecodeType(const std::string& value);
model::ClaimStatus  DecodeStatus(const std::string& value);
model::Priority     DecodePriority(const std::string& value);
model::Severity     DecodeSeverity(const std::string& value);
model::ClaimantKind DecodeClaimantKind(const std::string& value);

// Result artifacts are stored newline-separated.
std::string              JoinArtifacts(const std::vector<std::string>& artifacts);
std::vector<std::string> SplitArtifacts(const std::string& value);

} // namespace claims::db::codec
