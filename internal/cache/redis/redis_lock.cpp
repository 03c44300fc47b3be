#include "redis_lock.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "reply_check.hpp"

namespace cacheq::cache::redis {

namespace {

constexpr const char* kReleaseScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then return redis.call('del', KEYS[1]) else return 0 end";

constexpr const char* kRefreshScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then return redis.call('pexpire', KEYS[1], ARGV[2]) else return 0 end";

constexpr const char* kTTLScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then return redis.call('pttl', KEYS[1]) else return -3 end";

} // namespace

RedisLock::RedisLock(std::shared_ptr<RedisPool> pool, std::string key, std::string token, std::string metadata)
    : pool_(std::move(pool)),
      key_(std::move(key)),
      token_(std::move(token)),
      metadata_(std::move(metadata)) {
}

std::unique_ptr<RedisLock> RedisLock::Obtain(std::shared_ptr<RedisPool> pool, const std::string& key, std::chrono::milliseconds ttl,
                                             const LockOptions* options) {
  if (ttl.count() <= 0) {
    throw util::InvalidState("lock: ttl must be positive for key " + key);
  }

  const LockOptions defaults;
  const auto&       opts = options ? *options : defaults;

  auto lock = std::unique_ptr<RedisLock>(new RedisLock(std::move(pool), key, util::NewID(), opts.metadata));

  for (uint32_t attempt = 0;; ++attempt) {
    auto reply = CheckReply(lock->pool_->Execute({"SET", key, lock->Value(), "PX", std::to_string(ttl.count()), "NX"}), "lock " + key);
    if (!reply.IsNil()) {
      return lock;
    }

    if (attempt >= opts.retry_count) {
      break;
    }
    std::this_thread::sleep_for(opts.retry_backoff);
  }

  throw util::LockContention("lock: " + key + " is already held");
}

std::chrono::milliseconds RedisLock::TTL() {
  auto reply = CheckReply(pool_->Execute({"EVAL", kTTLScript, "1", key_, Value()}), "lock ttl " + key_);
  if (reply.integer <= 0) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::milliseconds(reply.integer);
}

void RedisLock::Refresh(std::chrono::milliseconds ttl) {
  auto reply = CheckReply(pool_->Execute({"EVAL", kRefreshScript, "1", key_, Value(), std::to_string(ttl.count())}), "lock refresh " + key_);
  if (reply.integer != 1) {
    throw util::LockNotHeld("lock: " + key_ + " is no longer held");
  }
}

void RedisLock::Release() {
  auto reply = CheckReply(pool_->Execute({"EVAL", kReleaseScript, "1", key_, Value()}), "lock release " + key_);
  if (reply.integer != 1) {
    throw util::LockNotHeld("lock: " + key_ + " is no longer held");
  }
  CACHEQ_LOG_DEBUG("lock released", {observability::StringField("key", key_)});
}

} // namespace cacheq::cache::redis
