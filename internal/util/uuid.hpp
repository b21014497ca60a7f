#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace capsule::util {

/*
  UUID helpers

  Version ids are random RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateVersionId() {
  return ToString(GenerateUUID());
}

} // namespace capsule::util
