#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "redis_connection.hpp"

namespace cacheq::cache::redis {

/*
  RedisPool

  Bounded set of connections shared by RedisCache callers.

  Design notes:
  -------------
  - Each command borrows one connection exclusively.
  - Connections are NOT thread-safe → never shared between callers.
  - Broken connections are discarded on release and their slot reopened.
  - Blocking readers (stream pollers) use Dial() so they never starve
    the pool.

  Lifetime:
    RedisCache owns shared_ptr<RedisPool>
    callers hold shared_ptr<RedisConnection> for the duration of a command
*/
class RedisPool : public std::enable_shared_from_this<RedisPool> {
 public:
  explicit RedisPool(ConnectionOptions options, std::size_t max_connections = 10);

  // Borrow a ready-to-use connection; returned to the pool when released.
  std::shared_ptr<RedisConnection> Acquire();

  // A fresh connection outside the pool.
  std::unique_ptr<RedisConnection> Dial() const;

  // Acquire + Command in one step.
  Reply Execute(const std::vector<std::string>& args);

 private:
  std::shared_ptr<RedisConnection> Wrap(RedisConnection* conn);
  void                             Release(RedisConnection* conn);

  ConnectionOptions options_;
  std::size_t       max_connections_;

  std::mutex                                    mutex_;
  std::condition_variable                       cv_;
  std::vector<std::unique_ptr<RedisConnection>> idle_;
  std::size_t                                   live_connections_ = 0;
};

} // namespace cacheq::cache::redis
