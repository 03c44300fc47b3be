#include "queue_registry.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cacheq::queue {

QueueRegistry::QueueRegistry(std::size_t capacity) : capacity_(capacity) {
}

StreamPtr QueueRegistry::GetOrCreate(const std::string& name) {
  {
    std::shared_lock lock(mutex_);
    if (closed_) {
      throw util::InvalidState("queue: stream " + name + " is closed; the cache has been shut down");
    }
    if (auto it = streams_.find(name); it != streams_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  if (closed_) {
    throw util::InvalidState("queue: stream " + name + " is closed; the cache has been shut down");
  }

  // another caller may have created it between the two locks
  auto [it, inserted] = streams_.try_emplace(name, nullptr);
  if (inserted) {
    it->second = std::make_shared<Stream>(name, capacity_);
    CACHEQ_LOG_DEBUG("stream created", {observability::StringField("stream", name),
                                        observability::IntField("capacity", static_cast<int64_t>(capacity_))});
  }
  return it->second;
}

StreamPtr QueueRegistry::Find(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = streams_.find(name);
  return it == streams_.end() ? nullptr : it->second;
}

std::vector<std::string> QueueRegistry::Names() const {
  std::shared_lock lock(mutex_);

  std::vector<std::string> names;
  names.reserve(streams_.size());
  for (const auto& [name, stream] : streams_) {
    names.push_back(name);
  }
  return names;
}

void QueueRegistry::CloseAll() {
  std::unique_lock lock(mutex_);
  closed_ = true;

  for (auto& [name, stream] : streams_) {
    stream->Advance(model::StreamState::kDraining);
    stream->Messages().Close();
  }
}

void QueueRegistry::MarkStopped() {
  std::shared_lock lock(mutex_);
  for (auto& [name, stream] : streams_) {
    if (!stream->Advance(model::StreamState::kStopped)) {
      CACHEQ_LOG_WARN("stream did not stop", {observability::StringField("stream", name), observability::StringField("state", model::ToString(stream->State()))});
    }
  }
}

bool QueueRegistry::Closed() const {
  std::shared_lock lock(mutex_);
  return closed_;
}

} // namespace cacheq::queue
