#include "item_store.hpp"

#include <mutex>

namespace cacheq::cache::memory {

bool ItemStore::IsExpired(const Entry& entry, util::TimePoint now) {
  return entry.expires_at <= now;
}

ItemStore::Shard& ItemStore::ShardFor(const std::string& key) {
  return shards_[std::hash<std::string>{}(key) % kShardCount];
}

// ------------------------------------------------------------
// Set
// ------------------------------------------------------------

void ItemStore::Set(const std::string& key, std::string value, util::TimePoint expires_at) {
  auto entry = std::make_shared<const Entry>(Entry{std::move(value), expires_at});

  auto&            shard = ShardFor(key);
  std::unique_lock lock(shard.mutex);
  shard.items[key] = std::move(entry);
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::string> ItemStore::Get(const std::string& key) {
  EntryPtr entry;
  {
    auto&            shard = ShardFor(key);
    std::shared_lock lock(shard.mutex);

    auto it = shard.items.find(key);
    if (it == shard.items.end()) return std::nullopt;
    entry = it->second;
  }

  if (IsExpired(*entry, util::Now())) {
    EvictIfSame(key, entry);
    return std::nullopt;
  }

  return entry->value;
}

bool ItemStore::EvictIfSame(const std::string& key, const EntryPtr& stale) {
  auto&            shard = ShardFor(key);
  std::unique_lock lock(shard.mutex);

  auto it = shard.items.find(key);
  if (it == shard.items.end() || it->second != stale) return false;

  shard.items.erase(it);
  return true;
}

// ------------------------------------------------------------
// Del
// ------------------------------------------------------------

void ItemStore::Del(const std::string& key) {
  auto&            shard = ShardFor(key);
  std::unique_lock lock(shard.mutex);
  shard.items.erase(key);
}

// ------------------------------------------------------------
// Update
// ------------------------------------------------------------

bool ItemStore::Update(const std::string& key, const std::function<Entry(const Entry&)>& fn) {
  auto&            shard = ShardFor(key);
  std::unique_lock lock(shard.mutex);

  auto it = shard.items.find(key);
  if (it == shard.items.end()) return false;

  if (IsExpired(*it->second, util::Now())) {
    shard.items.erase(it);
    return false;
  }

  it->second = std::make_shared<const Entry>(fn(*it->second));
  return true;
}

std::size_t ItemStore::Size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    total += shard.items.size();
  }
  return total;
}

} // namespace cacheq::cache::memory
