#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/cache/cache.hpp"
#include "internal/queue/channel.hpp"
#include "redis_pool.hpp"

namespace cacheq::cache::redis {

struct ConsumerOptions {
  // Consumer name inside each group; empty = host name.
  std::string name;

  std::chrono::milliseconds block_timeout{5000};
  std::chrono::milliseconds visibility_timeout{60000};
  std::chrono::milliseconds reclaim_interval{1000};

  uint32_t buffer_size = 100;
  uint32_t concurrency = 10;
};

/*
  Consumer-group reader for engine streams.

  Each registered stream is read through a consumer group named after the
  stream. One poller thread per stream blocks on XREADGROUP and feeds a
  shared buffer; worker threads run the handlers and XACK successes.
  A failed message stays pending and is claimed again with XAUTOCLAIM once
  it has been idle for the visibility timeout.
*/
class RedisConsumer {
 public:
  RedisConsumer(std::shared_ptr<RedisPool> pool, ConsumerOptions options);
  ~RedisConsumer();

  RedisConsumer(const RedisConsumer&)            = delete;
  RedisConsumer& operator=(const RedisConsumer&) = delete;

  // Creates the stream's consumer group. Must be called before Start();
  // throws util::InvalidState afterwards.
  void Register(const std::string& stream, ConsumerFunc handler);

  // Starts pollers and workers.
  void Start();

  // Stops polling, drains the buffer and joins every thread. Idempotent.
  void Stop();

  const std::string& Name() const {
    return options_.name;
  }

 private:
  void CreateGroup(RedisConnection& conn, const std::string& stream);
  void Poll(std::string stream);
  void Reclaim(RedisConnection& conn, const std::string& stream);
  void Enqueue(const std::string& stream, const Reply& entries);
  void Work();
  void Process(const model::Message& message);

  std::shared_ptr<RedisPool> pool_;
  ConsumerOptions            options_;

  std::mutex                                    mutex_;
  std::unordered_map<std::string, ConsumerFunc> handlers_;
  bool                                          started_ = false;

  std::atomic<bool>              stopping_{false};
  queue::Channel<model::Message> buffer_;
  std::vector<std::thread>       pollers_;
  std::vector<std::thread>       workers_;
};

} // namespace cacheq::cache::redis
