#include "uuid.hpp"

#include <random>

namespace cacheq::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::mt19937_64& Engine() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};

  // two 64-bit draws fill all 16 bytes
  for (std::size_t half = 0; half < 2; ++half) {
    auto bits = Engine()();
    for (std::size_t i = 0; i < 8; ++i) {
      id[half * 8 + i] = static_cast<uint8_t>(bits >> (i * 8));
    }
  }

  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40); // version 4
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80); // RFC4122 variant

  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);

  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
    out += kHexDigits[id[i] >> 4];
    out += kHexDigits[id[i] & 0x0F];
  }
  return out;
}

std::string NewID() {
  return ToString(GenerateUUID());
}

} // namespace cacheq::util
