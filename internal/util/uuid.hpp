#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace codeintel::util {

/*
  UUID helpers

  Job ids and session ids are random RFC4122 v4 UUIDs rendered as
  32 lowercase hex characters (no dashes).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToHex(const UUID& id);

// Random lowercase hex string of the given length.
std::string RandomHex(std::size_t length);

} // namespace codeintel::util
