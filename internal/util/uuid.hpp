#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lieko::util {

/*
  UUID helpers

  Generated record ids are RFC4122 v4 strings.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Random lowercase hex string of 2 * bytes characters, used for token secrets.
std::string GenerateSecret(std::size_t bytes = 32);

} // namespace lieko::util
