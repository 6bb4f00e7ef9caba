#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace relay::util {

/*
  UUID helpers

  Request and execution ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateId() {
  return ToString(GenerateUUID());
}

} // namespace relay::util
