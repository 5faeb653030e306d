#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace claims::util {

/*
  UUID helpers

  Claim and handoff ids are a prefix plus an RFC4122 v4 UUID in text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateId(std::string_view prefix);

} // namespace claims::util
