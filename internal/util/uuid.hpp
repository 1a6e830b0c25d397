#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace routebid::util {

/*
  UUID helpers

  Entity ids are random RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered as text.
std::string NewId();

} // namespace routebid::util
