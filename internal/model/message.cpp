#include "internal/model/message.hpp"

namespace cacheq::model {

std::string Message::GetPrefix() const {
  auto it = values.find(kPrefixKey);
  if (it == values.end()) {
    return {};
  }
  if (const auto* prefix = std::get_if<std::string>(&it->second)) {
    return *prefix;
  }
  return {};
}

void Message::SetPrefix(const std::string& prefix) {
  values[kPrefixKey] = prefix;
}

} // namespace cacheq::model
