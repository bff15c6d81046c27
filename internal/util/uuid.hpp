#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chainweave::util {

/*
  UUID helpers

  Run ids are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateRunID();

} // namespace chainweave::util
