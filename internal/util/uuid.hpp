#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace airspace::util {

/*
  UUID helpers

  Entity ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId();

} // namespace airspace::util
