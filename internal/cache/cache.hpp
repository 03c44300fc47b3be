#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/model/message.hpp"
#include "internal/model/value.hpp"

namespace cacheq::cache {

/*
  Consumer callback for Register().

  Returning normally acknowledges the message. Throwing a std::exception
  marks the delivery as failed and the message is delivered again.
*/
using ConsumerFunc = std::function<void(const model::Message&)>;

struct LockOptions {
  // Extra attempts after the first failed obtain.
  uint32_t                  retry_count = 0;
  std::chrono::milliseconds retry_backoff{100};

  // Opaque data stored next to the token.
  std::string metadata;
};

/*
  Handle to an obtained distributed lock.

  The lock expires on its own after the TTL; Release() ends it early.
*/
class LockHandle {
 public:
  virtual ~LockHandle() = default;

  virtual const std::string& Key() const      = 0;
  virtual const std::string& Token() const    = 0;
  virtual const std::string& Metadata() const = 0;

  // Remaining time to live; zero once expired or released.
  virtual std::chrono::milliseconds TTL() = 0;

  // Extends the lock. Throws util::LockNotHeld if it was lost.
  virtual void Refresh(std::chrono::milliseconds ttl) = 0;

  // Throws util::LockNotHeld if the lock was already lost.
  virtual void Release() = 0;
};

/*
  Cache and queue contract shared by every backend.

  Implementations:
    memory  → in-process store, channels and dispatcher threads
    redis   → Redis-compatible engine over RESP

  Errors are reported with the exception types in internal/util/errors.hpp.
*/
class Cache {
 public:
  virtual ~Cache() = default;

  // Backend name ("memory", "redis").
  virtual std::string String() const = 0;

  virtual void Connect() = 0;

  // Namespaces every key passed to the key-value operations.
  virtual void SetPrefix(const std::string& prefix) = 0;

  // ------------------------------------------------------------------
  // Key-value
  // ------------------------------------------------------------------
  virtual std::string Get(const std::string& key)                                        = 0;
  virtual void        Set(const std::string& key, const model::Value& value, int64_t ttl_seconds) = 0;
  virtual void        Del(const std::string& key)                                        = 0;

  virtual std::string HashGet(const std::string& hash, const std::string& field) = 0;
  virtual void        HashDel(const std::string& hash, const std::string& field) = 0;

  virtual void Increase(const std::string& key) = 0;
  virtual void Decrease(const std::string& key) = 0;

  virtual void Expire(const std::string& key, std::chrono::milliseconds duration) = 0;

  // ------------------------------------------------------------------
  // Queue
  // ------------------------------------------------------------------
  virtual void Append(const model::Message& message)                      = 0;
  virtual void Register(const std::string& stream, ConsumerFunc handler) = 0;

  // Blocks until Shutdown() is called.
  virtual void Run()      = 0;
  virtual void Shutdown() = 0;

  // ------------------------------------------------------------------
  // Lock
  // ------------------------------------------------------------------
  virtual std::unique_ptr<LockHandle> Lock(const std::string& key, int64_t ttl_seconds, const LockOptions* options) = 0;
};

using CachePtr = std::shared_ptr<Cache>;

} // namespace cacheq::cache
