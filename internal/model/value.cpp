#include "internal/model/value.hpp"

#include <charconv>
#include <system_error>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace cacheq::model {

namespace {

std::string EncodeDouble(double value) {
  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc{}) {
    throw util::EncodingError("encode: float value does not fit the output buffer");
  }
  return std::string(buffer, end);
}

} // namespace

std::string Encode(const Value& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          throw util::EncodingError("encode: value is empty and has no string form");
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return EncodeDouble(v);
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else {
          return std::string(v.data.begin(), v.data.end());
        }
      },
      value);
}

const char* TypeName(const Value& value) {
  switch (value.index()) {
    case 0:
      return "none";
    case 1:
      return "string";
    case 2:
      return "integer";
    case 3:
      return "float";
    case 4:
      return "boolean";
    default:
      return "bytes";
  }
}

} // namespace cacheq::model
