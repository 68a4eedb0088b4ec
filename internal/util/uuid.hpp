#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace shipyard::util {

/*
  Deploy and audit ids: RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

// Random bytes come from OpenSSL; throws std::runtime_error if it has no entropy.
UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace shipyard::util
