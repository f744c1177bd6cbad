#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace prdchat::util {

/*
  UUID helpers

  Message, run and block ids are RFC4122 v4 UUIDs rendered as 32 hex
  characters without dashes.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
std::string ToCompactString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToCompactString(GenerateUUID()).
std::string NewId();

} // namespace prdchat::util
