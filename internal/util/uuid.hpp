#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace hosting::util {

/*
  Random RFC4122 version 4 UUIDs, used as the opaque suffix of redirect keys.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase form.
std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace hosting::util
