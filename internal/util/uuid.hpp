#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace signage::util {

/*
  UUID helpers

  Entity ids are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace signage::util
