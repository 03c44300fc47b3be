#include "memory_cache.hpp"

#include "counter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cacheq::cache::memory {

using observability::IntField;
using observability::StringField;

MemoryCache::MemoryCache(MemoryCacheOptions options, runtime::ShutdownSignalPtr signal)
    : options_(options),
      signal_(signal ? std::move(signal) : std::make_shared<runtime::ShutdownSignal>()),
      registry_(std::make_shared<queue::QueueRegistry>(options.pool_num)),
      producer_(registry_) {
}

MemoryCache::~MemoryCache() {
  Shutdown();

  std::vector<std::unique_ptr<queue::Dispatcher>> unjoined;
  {
    std::unique_lock lock(dispatchers_mutex_);
    drained_cv_.wait(lock, [this] { return drained_; });
    unjoined.swap(unjoined_);
  }
  for (auto& dispatcher : unjoined) {
    if (!dispatcher->OnWorkerThread()) dispatcher->Join();
  }
}

std::string MemoryCache::String() const {
  return "memory";
}

void MemoryCache::Connect() {
  CACHEQ_LOG_INFO("memory cache ready", {IntField("pool_num", options_.pool_num), IntField("max_redeliveries", options_.max_redeliveries)});
}

void MemoryCache::SetPrefix(const std::string& prefix) {
  std::unique_lock lock(prefix_mutex_);
  prefix_ = prefix;
}

std::string MemoryCache::Namespaced(const std::string& key) const {
  std::shared_lock lock(prefix_mutex_);
  return prefix_ + key;
}

// ------------------------------------------------------------
// Key-value
// ------------------------------------------------------------

std::string MemoryCache::Get(const std::string& key) {
  auto value = items_.Get(Namespaced(key));
  if (!value) {
    throw util::NotFound(key + " not found");
  }
  return *value;
}

void MemoryCache::Set(const std::string& key, const model::Value& value, int64_t ttl_seconds) {
  auto encoded = model::Encode(value);
  items_.Set(Namespaced(key), std::move(encoded), util::ExpiryAfter(std::chrono::seconds(ttl_seconds)));
}

void MemoryCache::Del(const std::string& key) {
  items_.Del(Namespaced(key));
}

// hash fields share the flat key space: HashGet("a", "b") reads key "ab"
std::string MemoryCache::HashGet(const std::string& hash, const std::string& field) {
  return Get(hash + field);
}

void MemoryCache::HashDel(const std::string& hash, const std::string& field) {
  Del(hash + field);
}

void MemoryCache::Increase(const std::string& key) {
  ApplyDelta(items_, Namespaced(key), 1);
}

void MemoryCache::Decrease(const std::string& key) {
  ApplyDelta(items_, Namespaced(key), -1);
}

void MemoryCache::Expire(const std::string& key, std::chrono::milliseconds duration) {
  const auto expires_at = util::ExpiryAfter(duration);

  const bool found = items_.Update(Namespaced(key), [&](const ItemStore::Entry& current) {
    return ItemStore::Entry{current.value, expires_at};
  });

  if (!found) {
    throw util::NotFound(key + " not exist");
  }
}

std::size_t MemoryCache::ItemCount() const {
  return items_.Size();
}

// ------------------------------------------------------------
// Queue
// ------------------------------------------------------------

void MemoryCache::Append(const model::Message& message) {
  auto id = producer_.Append(message);
  CACHEQ_LOG_DEBUG("message appended", {StringField("stream", message.stream), StringField("id", id)});
}

void MemoryCache::Register(const std::string& stream, ConsumerFunc handler) {
  std::lock_guard lock(dispatchers_mutex_);
  if (stopped_) {
    throw util::InvalidState("register: cache has been shut down; cannot consume " + stream);
  }

  auto dispatcher = std::make_unique<queue::Dispatcher>(registry_->GetOrCreate(stream), std::move(handler),
                                                        queue::DispatcherOptions{options_.max_redeliveries});
  dispatcher->Start();
  dispatchers_.push_back(std::move(dispatcher));

  CACHEQ_LOG_INFO("consumer registered", {StringField("stream", stream), IntField("consumers", static_cast<int64_t>(dispatchers_.size()))});
}

void MemoryCache::Run() {
  signal_->Wait();

  // the signal may have been fired by another backend sharing it
  Shutdown();

  // a handler may still be finishing the Shutdown() it started
  std::unique_lock lock(dispatchers_mutex_);
  drained_cv_.wait(lock, [this] { return drained_; });
}

void MemoryCache::Shutdown() {
  std::vector<std::unique_ptr<queue::Dispatcher>> dispatchers;
  {
    std::lock_guard lock(dispatchers_mutex_);
    if (stopped_) return;
    stopped_ = true;
    dispatchers.swap(dispatchers_);
  }

  signal_->Trigger();

  // dispatchers only stop once their channels are closed
  registry_->CloseAll();

  std::vector<std::unique_ptr<queue::Dispatcher>> unjoined;
  for (auto& dispatcher : dispatchers) {
    if (dispatcher->OnWorkerThread()) {
      unjoined.push_back(std::move(dispatcher));
      continue;
    }
    dispatcher->Join();
  }
  registry_->MarkStopped();

  CACHEQ_LOG_INFO("memory cache stopped", {IntField("streams", static_cast<int64_t>(registry_->Names().size())),
                                           IntField("consumers", static_cast<int64_t>(dispatchers.size()))});

  // once drained_ is set the destructor may run; touch no members after this block
  {
    std::lock_guard lock(dispatchers_mutex_);
    for (auto& dispatcher : unjoined) unjoined_.push_back(std::move(dispatcher));
    drained_ = true;
    drained_cv_.notify_all();
  }
}

// ------------------------------------------------------------
// Lock
// ------------------------------------------------------------

std::unique_ptr<LockHandle> MemoryCache::Lock(const std::string& key, int64_t, const LockOptions*) {
  throw util::UnsupportedOperation("memory cache does not support distributed locks (key " + key + ")");
}

} // namespace cacheq::cache::memory
