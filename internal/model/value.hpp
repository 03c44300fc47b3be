#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cacheq::model {

// Raw bytes, kept apart from std::string so callers say what they mean.
struct Bytes {
  std::vector<std::uint8_t> data;

  bool operator==(const Bytes&) const = default;
};

/*
  Value accepted by Set() and carried in Message::values.

  std::monostate is "no value": it has no canonical string form and
  Encode() rejects it.
*/
using Value = std::variant<std::monostate, std::string, std::int64_t, double, bool, Bytes>;

// Canonical string form of a value. Throws util::EncodingError for std::monostate.
std::string Encode(const Value& value);

// Name of the held alternative, for error messages.
const char* TypeName(const Value& value);

} // namespace cacheq::model
