#include "dispatcher.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cacheq::queue {

using observability::IntField;
using observability::StringField;

Dispatcher::Dispatcher(StreamPtr stream, Handler handler, DispatcherOptions options)
    : stream_(std::move(stream)),
      handler_(std::move(handler)),
      options_(options) {
}

Dispatcher::~Dispatcher() {
  if (!thread_.joinable()) return;

  stream_->Messages().Close();
  if (OnWorkerThread()) {
    // destroyed from its own handler; the worker cannot wait for itself
    thread_.detach();
    return;
  }
  thread_.join();
}

void Dispatcher::Start() {
  thread_ = std::thread(&Dispatcher::Run, this);
}

void Dispatcher::Join() {
  if (!thread_.joinable()) return;

  if (OnWorkerThread()) {
    throw util::InvalidState("dispatcher: cannot be joined from its own handler; call Shutdown() outside consumer callbacks");
  }
  thread_.join();
}

void Dispatcher::Run() {
  CACHEQ_LOG_DEBUG("dispatcher started", {StringField("stream", stream_->Name())});

  while (auto delivery = stream_->Messages().Receive()) {
    ++delivery->attempts;

    try {
      handler_(delivery->message);
      ++succeeded_;
      continue;
    } catch (const std::exception& e) {
      ++failed_;
      CACHEQ_LOG_WARN("consumer failed; message will be redelivered",
                      {StringField("stream", stream_->Name()), StringField("id", delivery->message.id),
                       IntField("attempts", delivery->attempts), StringField("error", e.what())});
    }

    Requeue(std::move(*delivery));
  }

  CACHEQ_LOG_DEBUG("dispatcher stopped", {StringField("stream", stream_->Name()), IntField("succeeded", static_cast<int64_t>(succeeded_.load())),
                                          IntField("failed", static_cast<int64_t>(failed_.load())), IntField("dropped", static_cast<int64_t>(dropped_.load()))});
}

void Dispatcher::Requeue(Delivery delivery) {
  if (options_.max_redeliveries > 0 && delivery.attempts > options_.max_redeliveries) {
    ++dropped_;
    CACHEQ_LOG_ERROR("message exceeded max redeliveries; dropping",
                     {StringField("stream", stream_->Name()), StringField("id", delivery.message.id), IntField("attempts", delivery.attempts)});
    return;
  }

  const auto id = delivery.message.id;
  if (!stream_->Messages().Post(std::move(delivery))) {
    ++dropped_;
    CACHEQ_LOG_WARN("stream is draining; dropping failed message", {StringField("stream", stream_->Name()), StringField("id", id)});
  }
}

} // namespace cacheq::queue
