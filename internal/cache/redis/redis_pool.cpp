#include "redis_pool.hpp"

namespace cacheq::cache::redis {

RedisPool::RedisPool(ConnectionOptions options, std::size_t max_connections)
    : options_(std::move(options)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<RedisConnection> RedisPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          return Wrap(new RedisConnection(options_));
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::unique_ptr<RedisConnection> RedisPool::Dial() const {
  return std::make_unique<RedisConnection>(options_);
}

Reply RedisPool::Execute(const std::vector<std::string>& args) {
  auto conn = Acquire();
  return conn->Command(args);
}

std::shared_ptr<RedisConnection> RedisPool::Wrap(RedisConnection* conn) {
  std::weak_ptr<RedisPool> weak_self = shared_from_this();
  return std::shared_ptr<RedisConnection>(conn, [weak_self](RedisConnection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void RedisPool::Release(RedisConnection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->Broken()) {
      delete conn;
      --live_connections_;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace cacheq::cache::redis
