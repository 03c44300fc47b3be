#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/cache.hpp"
#include "internal/cache/memory/memory_cache.hpp"
#include "internal/cache/redis/redis_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using cacheq::cache::Cache;
using cacheq::cache::CachePtr;
using cacheq::model::Message;

struct BackendFactory {
  std::string               name;
  std::function<CachePtr()> make_cache;
  bool                      supports_lock = false;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

bool WaitUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

void VerifyKeyValue(Cache& cache) {
  cache.Set("k", std::string("v"), 60);
  assert(cache.Get("k") == "v");

  cache.Set("k", int64_t{7}, 60);
  assert(cache.Get("k") == "7");

  cache.Del("k");
  cache.Del("k");
  assert(Throws<cacheq::util::NotFound>([&] { cache.Get("k"); }));

  cache.Set("gone", std::string("v"), 0);
  assert(Throws<cacheq::util::NotFound>([&] { cache.Get("gone"); }));

  assert(Throws<cacheq::util::EncodingError>([&] { cache.Set("bad", cacheq::model::Value{}, 60); }));
}

void VerifyCounters(Cache& cache) {
  cache.Set("ctr", int64_t{10}, 60);
  cache.Increase("ctr");
  assert(cache.Get("ctr") == "11");
  cache.Decrease("ctr");
  cache.Decrease("ctr");
  assert(cache.Get("ctr") == "9");

  assert(Throws<cacheq::util::NotFound>([&] { cache.Increase("ctr-missing"); }));

  cache.Set("word", std::string("abc"), 60);
  assert(Throws<cacheq::util::TypeError>([&] { cache.Increase("word"); }));
  assert(cache.Get("word") == "abc");
}

void VerifyExpire(Cache& cache) {
  assert(Throws<cacheq::util::NotFound>([&] { cache.Expire("exp-missing", std::chrono::seconds(5)); }));

  cache.Set("exp", std::string("v"), 60);
  cache.Expire("exp", std::chrono::milliseconds(100));
  assert(cache.Get("exp") == "v");
  assert(WaitUntil(
      [&] {
        try {
          cache.Get("exp");
          return false;
        } catch (const cacheq::util::NotFound&) {
          return true;
        }
      },
      std::chrono::seconds(2)));
}

void VerifyQueueRedelivery(Cache& cache, const std::string& stream) {
  std::mutex               mutex;
  std::vector<std::string> ids;
  std::vector<std::string> skus;

  cache.Register(stream, [&](const Message& message) {
    std::lock_guard lock(mutex);
    ids.push_back(message.id);
    skus.push_back(cacheq::model::Encode(message.values.at("sku")));
    if (ids.size() == 1) throw std::runtime_error("first attempt fails");
  });

  std::thread runner([&cache] { cache.Run(); });

  Message message;
  message.stream        = stream;
  message.values["sku"] = std::string("A-100");
  message.SetPrefix("tenant-a");
  cache.Append(message);

  const bool delivered = WaitUntil(
      [&] {
        std::lock_guard lock(mutex);
        return ids.size() >= 2;
      },
      std::chrono::seconds(10));

  cache.Shutdown();
  runner.join();

  assert(delivered);
  assert(ids[0] == ids[1]);
  assert(skus[0] == "A-100" && skus[1] == "A-100");
}

void VerifyLock(Cache& cache) {
  cacheq::cache::LockOptions options;
  options.metadata = "owner-1";

  auto lock = cache.Lock("job", 5, &options);
  assert(lock->Metadata() == "owner-1");
  assert(!lock->Token().empty());
  assert(lock->TTL() > std::chrono::milliseconds(0));

  options.retry_count   = 2;
  options.retry_backoff = std::chrono::milliseconds(20);
  assert(Throws<cacheq::util::LockContention>([&] { cache.Lock("job", 5, &options); }));

  lock->Refresh(std::chrono::seconds(10));
  assert(lock->TTL() > std::chrono::seconds(5));

  lock->Release();
  assert(lock->TTL() == std::chrono::milliseconds(0));
  assert(Throws<cacheq::util::LockNotHeld>([&] { lock->Release(); }));
  assert(Throws<cacheq::util::LockNotHeld>([&] { lock->Refresh(std::chrono::seconds(1)); }));

  auto again = cache.Lock("job", 1, nullptr);
  again->Release();
}

void RunBackendSuite(const BackendFactory& backend) {
  const auto run_id = cacheq::util::NewID();

  auto cache = backend.make_cache();
  cache->Connect();
  cache->SetPrefix("cacheq-test:" + run_id + ":");

  VerifyKeyValue(*cache);
  VerifyCounters(*cache);
  VerifyExpire(*cache);
  if (backend.supports_lock) {
    VerifyLock(*cache);
  } else {
    assert(Throws<cacheq::util::UnsupportedOperation>([&] { cache->Lock("job", 5, nullptr); }));
  }
  VerifyQueueRedelivery(*cache, "cacheq-test-" + run_id);

  std::cout << "  " << backend.name << ": pass\n";
}

BackendFactory MakeMemoryFactory() {
  return {"memory", [] { return std::make_shared<cacheq::cache::memory::MemoryCache>(); }, false};
}

BackendFactory MakeRedisFactory() {
  const char* address = std::getenv("CACHEQ_REDIS_ADDRESS");
  if (address == nullptr || std::string(address).empty()) {
    throw std::runtime_error("CACHEQ_REDIS_ADDRESS is not set");
  }

  cacheq::cache::redis::RedisCacheOptions options;
  options.connection                  = cacheq::cache::redis::ParseAddress(address);
  options.pool_size                   = 4;
  options.consumer.block_timeout      = std::chrono::milliseconds(200);
  options.consumer.visibility_timeout = std::chrono::milliseconds(300);
  options.consumer.reclaim_interval   = std::chrono::milliseconds(100);
  options.consumer.concurrency        = 2;

  return {"redis", [options] { return std::make_shared<cacheq::cache::redis::RedisCache>(options); }, true};
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

  try {
    backends.push_back(MakeRedisFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping redis integration suite: " << ex.what() << "\n";
  }

  for (const auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "cacheq_integration_cache_parity: pass\n";
  return 0;
}
