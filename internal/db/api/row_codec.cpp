#include "internal/db/api/row_codec.hpp"

#include <sstream>
#include <stdexcept>

namespace claims::db::codec {

namespace {

template <typename T>
T Require(const std::optional<T>& value, const char* what, const std::string& raw) {
  if (!value) throw std::runtime_error(std::string("corrupt claim row: unknown ") + what + " '" + raw + "'");
  return *value;
}

} // namespace

model::ClaimType DecodeType(const std::string& value) {
  return Require(model::ParseClaimType(value), "type", value);
}

model::ClaimStatus DecodeStatus(const std::string& value) {
  return Require(model::ParseClaimStatus(value), "status", value);
}

model::Priority DecodePriority(const std::string& value) {
  return Require(model::ParsePriority(value), "priority", value);
}

model::Severity DecodeSeverity(const std::string& value) {
  return Require(model::ParseSeverity(value), "severity", value);
}

model::ClaimantKind DecodeClaimantKind(const std::string& value) {
  return Require(model::ParseClaimantKind(value), "claimant kind", value);
}

std::string JoinArtifacts(const std::vector<std::string>& artifacts) {
  std::string out;
  for (std::size_t i = 0; i < artifacts.size(); ++i) {
    if (i > 0) out += '\n';
    out += artifacts[i];
  }
  return out;
}

std::vector<std::string> SplitArtifacts(const std::string& value) {
  std::vector<std::string> out;
  if (value.empty()) return out;

  std::istringstream in(value);
  std::string        line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

} // namespace claims::db::codec
