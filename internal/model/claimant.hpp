#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace claims::model {

enum class ClaimantKind : std::uint8_t {
  kAgent = 0,
  kHuman = 1,
};

constexpr std::string_view ToString(ClaimantKind kind) {
  return kind == ClaimantKind::kHuman ? "human" : "agent";
}

std::optional<ClaimantKind> ParseClaimantKind(std::string_view value);

/*
  Tagged claimant identity shared by agents and humans.
  agent_type is only meaningful for kAgent.
*/
struct Claimant {
  std::string  id;
  ClaimantKind kind = ClaimantKind::kAgent;
  std::string  name;
  std::string  domain;
  std::string  agent_type;

  bool IsAgent() const {
    return kind == ClaimantKind::kAgent;
  }
  bool IsHuman() const {
    return kind == ClaimantKind::kHuman;
  }
};

inline bool operator==(const Claimant& lhs, const Claimant& rhs) {
  return lhs.id == rhs.id && lhs.kind == rhs.kind && lhs.name == rhs.name && lhs.domain == rhs.domain && lhs.agent_type == rhs.agent_type;
}

} // namespace claims::model
