#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "internal/cache/cache.hpp"
#include "internal/runtime/shutdown_signal.hpp"
#include "redis_consumer.hpp"
#include "redis_pool.hpp"

namespace cacheq::cache::redis {

struct ProducerOptions {
  // 0 = streams are not trimmed on XADD.
  uint64_t stream_max_length      = 0;
  bool     approximate_max_length = true;
};

struct RedisCacheOptions {
  ConnectionOptions connection;
  std::size_t       pool_size = 10;
  ConsumerOptions   consumer;
  ProducerOptions   producer;
};

/*
  Networked backend over a Redis-compatible engine.

  Keys, hashes and counters map onto the engine's own commands. Streams
  are engine streams read through consumer groups (see RedisConsumer);
  locks are RedisLock tokens.

  Connect() must succeed before any other operation.
*/
class RedisCache final : public Cache {
 public:
  explicit RedisCache(RedisCacheOptions options, runtime::ShutdownSignalPtr signal = nullptr);
  ~RedisCache() override;

  RedisCache(const RedisCache&)            = delete;
  RedisCache& operator=(const RedisCache&) = delete;

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

  void Run() override;
  void Shutdown() override;

  std::unique_ptr<LockHandle> Lock(const std::string& key, int64_t ttl_seconds, const LockOptions* options) override;

  // Raw engine access for commands the interface does not cover.
  std::shared_ptr<RedisPool> Pool() const;

 private:
  std::string                Namespaced(const std::string& key) const;
  std::shared_ptr<RedisPool> RequirePool() const;
  void                       ApplyDelta(const std::string& key, int64_t delta);

  RedisCacheOptions          options_;
  runtime::ShutdownSignalPtr signal_;

  mutable std::mutex              mutex_;
  std::shared_ptr<RedisPool>      pool_;
  std::unique_ptr<RedisConsumer>  consumer_;

  mutable std::shared_mutex prefix_mutex_;
  std::string               prefix_;
};

} // namespace cacheq::cache::redis
