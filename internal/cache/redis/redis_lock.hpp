#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/cache/cache.hpp"
#include "redis_pool.hpp"

namespace cacheq::cache::redis {

/*
  Token lock on a single engine key.

  The key holds token+metadata with a PX expiry. Refresh, TTL and Release
  only act while the key still holds this lock's value, so a lock that
  expired and was taken by someone else is never touched.
*/
class RedisLock final : public LockHandle {
 public:
  // SET NX PX with the configured retries. Throws util::LockContention.
  static std::unique_ptr<RedisLock> Obtain(std::shared_ptr<RedisPool> pool, const std::string& key, std::chrono::milliseconds ttl,
                                           const LockOptions* options);

  const std::string& Key() const override {
    return key_;
  }
  const std::string& Token() const override {
    return token_;
  }
  const std::string& Metadata() const override {
    return metadata_;
  }

  std::chrono::milliseconds TTL() override;
  void                      Refresh(std::chrono::milliseconds ttl) override;
  void                      Release() override;

 private:
  RedisLock(std::shared_ptr<RedisPool> pool, std::string key, std::string token, std::string metadata);

  std::string Value() const {
    return token_ + metadata_;
  }

  std::shared_ptr<RedisPool> pool_;
  std::string                key_;
  std::string                token_;
  std::string                metadata_;
};

} // namespace cacheq::cache::redis
