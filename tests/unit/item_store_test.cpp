#include "internal/cache/memory/item_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using cacheq::cache::memory::ItemStore;
using cacheq::util::Now;

void TestSetGetDel() {
  ItemStore store;
  store.Set("a", "1", Now() + std::chrono::hours(1));

  auto value = store.Get("a");
  assert(value && *value == "1");

  store.Set("a", "2", Now() + std::chrono::hours(1));
  assert(*store.Get("a") == "2");

  store.Del("a");
  assert(!store.Get("a"));

  // idempotent
  store.Del("a");
  assert(store.Size() == 0);
}

void TestExpiredEntryIsEvictedOnRead() {
  ItemStore store;
  store.Set("gone", "x", Now() - std::chrono::seconds(1));
  store.Set("now", "x", Now());

  assert(store.Size() == 2);
  assert(!store.Get("gone"));
  assert(!store.Get("now"));
  assert(store.Size() == 0);
}

void TestUpdateKeepsOrRejects() {
  ItemStore  store;
  const auto expiry = Now() + std::chrono::hours(1);
  store.Set("k", "v", expiry);

  bool found = store.Update("k", [](const ItemStore::Entry& current) { return ItemStore::Entry{current.value + "!", current.expires_at}; });
  assert(found);
  assert(*store.Get("k") == "v!");

  bool called = false;
  found       = store.Update("missing", [&](const ItemStore::Entry& current) {
    called = true;
    return current;
  });
  assert(!found && !called);

  store.Set("stale", "v", Now() - std::chrono::seconds(1));
  found = store.Update("stale", [&](const ItemStore::Entry& current) {
    called = true;
    return current;
  });
  assert(!found && !called);
  assert(store.Size() == 1);
}

void TestEvictionNeverClobbersFreshSet() {
  ItemStore store;

  for (int round = 0; round < 200; ++round) {
    const std::string key = "race-" + std::to_string(round);
    store.Set(key, "stale", Now() - std::chrono::seconds(1));

    std::atomic<bool> go{false};
    std::thread       reader([&] {
      while (!go) {
      }
      for (int i = 0; i < 20; ++i) (void)store.Get(key);
    });
    std::thread writer([&] {
      while (!go) {
      }
      store.Set(key, "fresh", Now() + std::chrono::hours(1));
    });

    go = true;
    reader.join();
    writer.join();

    auto value = store.Get(key);
    assert(value && *value == "fresh");
  }
}

} // namespace

int main() {
  TestSetGetDel();
  TestExpiredEntryIsEvictedOnRead();
  TestUpdateKeepsOrRejects();
  TestEvictionNeverClobbersFreshSet();

  std::cout << "cacheq_unit_item_store: pass\n";
  return 0;
}
