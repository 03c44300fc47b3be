#include "redis_cache.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "redis_lock.hpp"
#include "reply_check.hpp"

namespace cacheq::cache::redis {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

// GET + INCRBY in one step so a missing key is an error instead of a new 0.
constexpr const char* kCounterScript = R"(
local current = redis.call('GET', KEYS[1])
if current == false then
  return redis.error_reply('NOTEXIST ' .. KEYS[1] .. ' not exist')
end
return redis.call('INCRBY', KEYS[1], ARGV[1])
)";

} // namespace

RedisCache::RedisCache(RedisCacheOptions options, runtime::ShutdownSignalPtr signal)
    : options_(std::move(options)), signal_(signal ? std::move(signal) : std::make_shared<runtime::ShutdownSignal>()) {
}

RedisCache::~RedisCache() {
  Shutdown();

  std::unique_ptr<RedisConsumer> consumer;
  {
    std::lock_guard lock(mutex_);
    consumer.swap(consumer_);
  }
  if (consumer) consumer->Stop();
}

std::string RedisCache::String() const {
  return "redis";
}

void RedisCache::Connect() {
  auto pool = std::make_shared<RedisPool>(options_.connection, options_.pool_size);

  auto pong = CheckReply(pool->Execute({"PING"}), "ping");
  if (pong.str != "PONG") {
    throw util::Unavailable("ping " + options_.connection.host + ": unexpected reply " + pong.str);
  }

  {
    std::lock_guard lock(mutex_);
    pool_     = pool;
    consumer_ = std::make_unique<RedisConsumer>(pool, options_.consumer);
  }

  CACHEQ_LOG_INFO("redis cache connected", {StringField("host", options_.connection.host), IntField("port", options_.connection.port),
                                            IntField("db", options_.connection.db), BoolField("auth", !options_.connection.password.empty()),
                                            IntField("pool_size", static_cast<int64_t>(options_.pool_size))});
}

void RedisCache::SetPrefix(const std::string& prefix) {
  std::unique_lock lock(prefix_mutex_);
  prefix_ = prefix;
}

std::string RedisCache::Namespaced(const std::string& key) const {
  std::shared_lock lock(prefix_mutex_);
  return prefix_ + key;
}

std::shared_ptr<RedisPool> RedisCache::RequirePool() const {
  std::lock_guard lock(mutex_);
  if (!pool_) {
    throw util::InvalidState("redis cache is not connected");
  }
  return pool_;
}

std::shared_ptr<RedisPool> RedisCache::Pool() const {
  return RequirePool();
}

// ------------------------------------------------------------
// Key-value
// ------------------------------------------------------------

std::string RedisCache::Get(const std::string& key) {
  auto reply = CheckReply(RequirePool()->Execute({"GET", Namespaced(key)}), "get " + key);
  if (reply.IsNil()) {
    throw util::NotFound(key + " not found");
  }
  return reply.str;
}

void RedisCache::Set(const std::string& key, const model::Value& value, int64_t ttl_seconds) {
  auto encoded = model::Encode(value);
  auto pool    = RequirePool();

  // a non-positive ttl leaves the key already expired
  if (ttl_seconds <= 0) {
    CheckReply(pool->Execute({"DEL", Namespaced(key)}), "set " + key);
    return;
  }
  CheckReply(pool->Execute({"SET", Namespaced(key), encoded, "EX", std::to_string(ttl_seconds)}), "set " + key);
}

void RedisCache::Del(const std::string& key) {
  CheckReply(RequirePool()->Execute({"DEL", Namespaced(key)}), "del " + key);
}

std::string RedisCache::HashGet(const std::string& hash, const std::string& field) {
  auto reply = CheckReply(RequirePool()->Execute({"HGET", Namespaced(hash), field}), "hget " + hash);
  if (reply.IsNil()) {
    throw util::NotFound(hash + "/" + field + " not found");
  }
  return reply.str;
}

void RedisCache::HashDel(const std::string& hash, const std::string& field) {
  CheckReply(RequirePool()->Execute({"HDEL", Namespaced(hash), field}), "hdel " + hash);
}

void RedisCache::Increase(const std::string& key) {
  ApplyDelta(key, 1);
}

void RedisCache::Decrease(const std::string& key) {
  ApplyDelta(key, -1);
}

void RedisCache::ApplyDelta(const std::string& key, int64_t delta) {
  CheckReply(RequirePool()->Execute({"EVAL", kCounterScript, "1", Namespaced(key), std::to_string(delta)}), "counter " + key);
}

void RedisCache::Expire(const std::string& key, std::chrono::milliseconds duration) {
  auto reply = CheckReply(RequirePool()->Execute({"PEXPIRE", Namespaced(key), std::to_string(duration.count())}), "expire " + key);
  if (reply.integer == 0) {
    throw util::NotFound(key + " not exist");
  }
}

// ------------------------------------------------------------
// Queue
// ------------------------------------------------------------

void RedisCache::Append(const model::Message& message) {
  if (message.stream.empty()) {
    throw util::InvalidState("append: message has no stream");
  }
  if (message.values.empty()) {
    throw util::InvalidState("append: message for " + message.stream + " has no values");
  }
  if (signal_->Triggered()) {
    throw util::InvalidState("append: cache has been shut down; dropped message for " + message.stream);
  }

  std::vector<std::string> args{"XADD", message.stream};
  if (options_.producer.stream_max_length > 0) {
    args.emplace_back("MAXLEN");
    if (options_.producer.approximate_max_length) {
      args.emplace_back("~");
    }
    args.push_back(std::to_string(options_.producer.stream_max_length));
  }
  args.emplace_back("*");
  for (const auto& [field, value] : message.values) {
    args.push_back(field);
    args.push_back(model::Encode(value));
  }

  auto reply = CheckReply(RequirePool()->Execute(args), "append " + message.stream);
  CACHEQ_LOG_DEBUG("message appended", {StringField("stream", message.stream), StringField("id", reply.str)});
}

void RedisCache::Register(const std::string& stream, ConsumerFunc handler) {
  {
    std::lock_guard lock(mutex_);
    if (!consumer_) {
      throw util::InvalidState("register: redis cache is not connected");
    }
    consumer_->Register(stream, std::move(handler));
  }
  CACHEQ_LOG_INFO("consumer registered", {StringField("stream", stream)});
}

void RedisCache::Run() {
  RedisConsumer* consumer = nullptr;
  {
    std::lock_guard lock(mutex_);
    if (!consumer_) {
      throw util::InvalidState("run: redis cache is not connected");
    }
    consumer = consumer_.get();
  }

  consumer->Start();
  signal_->Wait();
  consumer->Stop();

  CACHEQ_LOG_INFO("redis cache stopped", {StringField("consumer", consumer->Name())});
}

void RedisCache::Shutdown() {
  signal_->Trigger();
}

// ------------------------------------------------------------
// Lock
// ------------------------------------------------------------

std::unique_ptr<LockHandle> RedisCache::Lock(const std::string& key, int64_t ttl_seconds, const LockOptions* options) {
  return RedisLock::Obtain(RequirePool(), Namespaced(key), std::chrono::seconds(ttl_seconds), options);
}

} // namespace cacheq::cache::redis
