#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace cacheq::util {

/*
  UUID helpers

  Delivery ids and lock tokens are random RFC4122 version 4 UUIDs
  rendered in the canonical 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered as a string.
std::string NewID();

} // namespace cacheq::util
