#pragma once

#include <cstdint>
#include <string>

#include "item_store.hpp"

namespace cacheq::cache::memory {

// Parses a stored counter value. Throws util::TypeError.
int64_t ParseCounter(const std::string& key, const std::string& value);

/*
  Adds delta to the integer stored at key and returns the new value.

  The whole read-compute-write runs under the key's shard lock, so
  concurrent callers on one key never lose updates. The entry keeps its
  expiry. Throws util::NotFound when the key is absent or expired and
  util::TypeError when the value is not an integer or would overflow.
*/
int64_t ApplyDelta(ItemStore& store, const std::string& key, int64_t delta);

} // namespace cacheq::cache::memory
