#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/cache/cache.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/queue/producer.hpp"
#include "internal/queue/queue_registry.hpp"
#include "internal/runtime/shutdown_signal.hpp"
#include "item_store.hpp"

namespace cacheq::cache::memory {

struct MemoryCacheOptions {
  // Buffered messages per stream; 0 = unbounded.
  uint32_t pool_num = 0;

  // 0 = failing messages are redelivered forever.
  uint32_t max_redeliveries = 0;
};

/*
  In-process backend.

  Single-process only: nothing survives a restart and Lock() is not
  supported. Streams are in-process channels; every Register() starts one
  dispatcher thread, and several registrations on one stream share its
  messages (each message goes to exactly one of them).
*/
class MemoryCache final : public Cache {
 public:
  explicit MemoryCache(MemoryCacheOptions options = {}, runtime::ShutdownSignalPtr signal = nullptr);
  ~MemoryCache() override;

  MemoryCache(const MemoryCache&)            = delete;
  MemoryCache& operator=(const MemoryCache&) = delete;

  std::string String() const override;
  void        Connect() override;
  void        SetPrefix(const std::string& prefix) override;

  std::string Get(const std::string& key) override;
  void        Set(const std::string& key, const model::Value& value, int64_t ttl_seconds) override;
  void        Del(const std::string& key) override;

  std::string HashGet(const std::string& hash, const std::string& field) override;
  void        HashDel(const std::string& hash, const std::string& field) override;

  void Increase(const std::string& key) override;
  void Decrease(const std::string& key) override;

  void Expire(const std::string& key, std::chrono::milliseconds duration) override;

  void Append(const model::Message& message) override;
  void Register(const std::string& stream, ConsumerFunc handler) override;

  // Returns once the signal fires, after the queue has been shut down.
  void Run() override;

  // Safe to call from inside a consumer callback: that dispatcher is not
  // waited for and finishes on its own once the handler returns.
  void Shutdown() override;

  std::unique_ptr<LockHandle> Lock(const std::string& key, int64_t ttl_seconds, const LockOptions* options) override;

  // Key-value entries currently held, including expired ones not yet evicted.
  std::size_t ItemCount() const;

 private:
  std::string Namespaced(const std::string& key) const;

  MemoryCacheOptions         options_;
  runtime::ShutdownSignalPtr signal_;

  ItemStore                             items_;
  std::shared_ptr<queue::QueueRegistry> registry_;
  queue::Producer                       producer_;

  std::mutex                                      dispatchers_mutex_;
  std::vector<std::unique_ptr<queue::Dispatcher>> dispatchers_;
  // dispatchers whose handler called Shutdown(); joined by the destructor
  std::vector<std::unique_ptr<queue::Dispatcher>> unjoined_;
  bool                                            stopped_ = false;
  // set once the Shutdown() that claimed stopped_ has finished
  bool                                            drained_ = false;
  std::condition_variable                         drained_cv_;

  mutable std::shared_mutex prefix_mutex_;
  std::string               prefix_;
};

} // namespace cacheq::cache::memory
