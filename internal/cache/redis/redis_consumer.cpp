#include "redis_consumer.hpp"

#include <unistd.h>

#include <climits>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "reply_check.hpp"

namespace cacheq::cache::redis {

using observability::IntField;
using observability::StringField;

namespace {

std::string HostName() {
  char name[HOST_NAME_MAX + 1] = {};
  if (::gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
    return "cacheq";
  }
  return name;
}

// [id, [field, value, ...]] → Message; nullopt for entries deleted while pending
std::optional<model::Message> DecodeEntry(const std::string& stream, const Reply& entry) {
  if (!entry.IsArray() || entry.elements.size() != 2) {
    throw util::ProtocolError("stream entry from " + stream + " is not [id, fields]");
  }

  model::Message message;
  message.stream = stream;
  message.id     = entry.elements[0].str;

  const auto& fields = entry.elements[1];
  if (fields.IsNil()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i + 1 < fields.elements.size(); i += 2) {
    message.values[fields.elements[i].str] = fields.elements[i + 1].str;
  }
  return message;
}

} // namespace

RedisConsumer::RedisConsumer(std::shared_ptr<RedisPool> pool, ConsumerOptions options)
    : pool_(std::move(pool)),
      options_(std::move(options)),
      buffer_(options_.buffer_size) {
  if (options_.name.empty()) {
    options_.name = HostName();
  }
  if (options_.concurrency == 0) {
    options_.concurrency = 1;
  }
}

RedisConsumer::~RedisConsumer() {
  Stop();
}

void RedisConsumer::Register(const std::string& stream, ConsumerFunc handler) {
  std::lock_guard lock(mutex_);
  if (started_) {
    throw util::InvalidState("register: consumer is already running; register " + stream + " before Run()");
  }

  // the group exists before Register returns so later appends are never missed
  auto conn = pool_->Acquire();
  CreateGroup(*conn, stream);
  handlers_[stream] = std::move(handler);
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void RedisConsumer::Start() {
  std::lock_guard lock(mutex_);
  if (started_ || stopping_) return;
  started_ = true;

  for (uint32_t i = 0; i < options_.concurrency; ++i) {
    workers_.emplace_back(&RedisConsumer::Work, this);
  }
  for (const auto& [stream, handler] : handlers_) {
    pollers_.emplace_back(&RedisConsumer::Poll, this, stream);
  }

  CACHEQ_LOG_INFO("redis consumer started", {StringField("consumer", options_.name), IntField("streams", static_cast<int64_t>(handlers_.size())),
                                             IntField("concurrency", options_.concurrency)});
}

void RedisConsumer::Stop() {
  if (stopping_.exchange(true)) return;

  // pollers notice stopping_ after their current blocking read
  for (auto& poller : pollers_) {
    if (poller.joinable()) poller.join();
  }

  buffer_.Close();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

void RedisConsumer::CreateGroup(RedisConnection& conn, const std::string& stream) {
  auto reply = conn.Command({"XGROUP", "CREATE", stream, stream, "$", "MKSTREAM"});
  if (reply.IsError() && reply.str.rfind("BUSYGROUP", 0) != 0) {
    CheckReply(std::move(reply), "create consumer group " + stream);
  }
}

// ------------------------------------------------------------
// Polling
// ------------------------------------------------------------

void RedisConsumer::Poll(std::string stream) {
  std::unique_ptr<RedisConnection> conn;
  auto                             last_reclaim = std::chrono::steady_clock::time_point{};

  while (!stopping_) {
    try {
      if (!conn || conn->Broken()) {
        conn = pool_->Dial();
      }

      if (std::chrono::steady_clock::now() - last_reclaim >= options_.reclaim_interval) {
        Reclaim(*conn, stream);
        last_reclaim = std::chrono::steady_clock::now();
      }

      if (!buffer_.WaitForSpace(options_.block_timeout)) {
        continue;
      }

      auto reply = CheckReply(conn->Command({"XREADGROUP", "GROUP", stream, options_.name, "COUNT", std::to_string(options_.buffer_size), "BLOCK",
                                             std::to_string(options_.block_timeout.count()), "STREAMS", stream, ">"}),
                              "read " + stream);

      // nil = block timeout with nothing new
      if (reply.IsNil()) continue;

      for (const auto& per_stream : reply.elements) {
        if (per_stream.elements.size() == 2) {
          Enqueue(stream, per_stream.elements[1]);
        }
      }
    } catch (const std::exception& e) {
      CACHEQ_LOG_ERROR("redis poll failed", {StringField("stream", stream), StringField("error", e.what())});
      conn.reset();
      std::this_thread::sleep_for(options_.reclaim_interval);
    }
  }
}

void RedisConsumer::Reclaim(RedisConnection& conn, const std::string& stream) {
  std::string cursor = "0-0";
  do {
    auto reply = CheckReply(conn.Command({"XAUTOCLAIM", stream, stream, options_.name, std::to_string(options_.visibility_timeout.count()), cursor,
                                          "COUNT", std::to_string(options_.buffer_size)}),
                            "reclaim " + stream);

    if (!reply.IsArray() || reply.elements.size() < 2) {
      throw util::ProtocolError("reclaim " + stream + ": unexpected XAUTOCLAIM reply");
    }

    cursor = reply.elements[0].str;
    Enqueue(stream, reply.elements[1]);
  } while (cursor != "0-0" && !stopping_);
}

void RedisConsumer::Enqueue(const std::string& stream, const Reply& entries) {
  for (const auto& entry : entries.elements) {
    auto message = DecodeEntry(stream, entry);
    if (!message) continue;

    if (!buffer_.Post(std::move(*message))) {
      // still pending in the group; another consumer will claim it
      return;
    }
  }
}

// ------------------------------------------------------------
// Workers
// ------------------------------------------------------------

void RedisConsumer::Work() {
  while (auto message = buffer_.Receive()) {
    Process(*message);
  }
}

void RedisConsumer::Process(const model::Message& message) {
  ConsumerFunc handler;
  {
    std::lock_guard lock(mutex_);
    auto            it = handlers_.find(message.stream);
    if (it == handlers_.end()) return;
    handler = it->second;
  }

  try {
    handler(message);
  } catch (const std::exception& e) {
    CACHEQ_LOG_WARN("consumer failed; message stays pending for reclaim",
                    {StringField("stream", message.stream), StringField("id", message.id), StringField("error", e.what())});
    return;
  }

  try {
    CheckReply(pool_->Execute({"XACK", message.stream, message.stream, message.id}), "ack " + message.stream);
  } catch (const std::exception& e) {
    CACHEQ_LOG_ERROR("redis ack failed", {StringField("stream", message.stream), StringField("id", message.id), StringField("error", e.what())});
  }
}

} // namespace cacheq::cache::redis
