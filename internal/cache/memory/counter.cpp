#include "counter.hpp"

#include <charconv>
#include <limits>
#include <system_error>

#include "internal/util/errors.hpp"

namespace cacheq::cache::memory {

int64_t ParseCounter(const std::string& key, const std::string& value) {
  int64_t     parsed = 0;
  const char* first  = value.data();
  const char* last   = value.data() + value.size();

  // from_chars rejects a leading '+'; accept it like strconv does
  bool signed_plus = false;
  if (first != last && *first == '+') {
    ++first;
    signed_plus = true;
  }

  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc{} || ptr != last || (signed_plus && parsed < 0)) {
    throw util::TypeError("value of " + key + " is not an integer: \"" + value + "\"");
  }
  return parsed;
}

int64_t ApplyDelta(ItemStore& store, const std::string& key, int64_t delta) {
  int64_t result = 0;

  const bool found = store.Update(key, [&](const ItemStore::Entry& current) {
    const auto value = ParseCounter(key, current.value);

    if ((delta > 0 && value > std::numeric_limits<int64_t>::max() - delta) ||
        (delta < 0 && value < std::numeric_limits<int64_t>::min() - delta)) {
      throw util::TypeError("increment or decrement of " + key + " would overflow");
    }

    result = value + delta;
    return ItemStore::Entry{std::to_string(result), current.expires_at};
  });

  if (!found) {
    throw util::NotFound(key + " not exist");
  }
  return result;
}

} // namespace cacheq::cache::memory
