#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace cacheq::cache::memory {

/*
  Concurrent key → value+expiry map.

  Expired entries are never swept in the background: they stay in the map
  until the next access to their key removes them.

  Entries are immutable once stored; every change installs a new Entry.
  This lets Get() evict by comparing against the exact stale Entry it saw,
  so a Set() racing with the eviction is never lost.
*/
class ItemStore {
 public:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at;
  };

  using EntryPtr = std::shared_ptr<const Entry>;

  // Overwrites any existing entry.
  void Set(const std::string& key, std::string value, util::TimePoint expires_at);

  // nullopt when absent or expired; an expired entry is removed.
  std::optional<std::string> Get(const std::string& key);

  // Idempotent.
  void Del(const std::string& key);

  /*
    Read-modify-write on a live entry.

    fn runs under the exclusive lock of the key's shard and returns the
    replacement. Returns false when the key is absent or expired (fn is not
    called). Exceptions from fn leave the entry unchanged.
  */
  bool Update(const std::string& key, const std::function<Entry(const Entry&)>& fn);

  // Entries physically held, including expired ones not yet evicted.
  std::size_t Size() const;

 private:
  static constexpr std::size_t kShardCount = 64;

  struct Shard {
    mutable std::shared_mutex                 mutex;
    std::unordered_map<std::string, EntryPtr> items;
  };

  static bool IsExpired(const Entry& entry, util::TimePoint now);

  Shard& ShardFor(const std::string& key);

  // Removes key only if it still maps to stale.
  bool EvictIfSame(const std::string& key, const EntryPtr& stale);

  std::array<Shard, kShardCount> shards_;
};

} // namespace cacheq::cache::memory
