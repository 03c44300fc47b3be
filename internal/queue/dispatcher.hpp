#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>

#include "internal/model/message.hpp"
#include "stream.hpp"

namespace cacheq::queue {

using Handler = std::function<void(const model::Message&)>;

struct DispatcherOptions {
  // 0 = a failing message is redelivered forever.
  uint32_t max_redeliveries = 0;
};

/*
  Background consumer for one registration on a stream.

  Pulls deliveries from the stream's channel and runs the handler. A
  handler that throws gets the same message again: it is posted back to
  the tail of the same channel, immediately and without backoff. The
  worker ends when the channel is closed and drained.
*/
class Dispatcher {
 public:
  Dispatcher(StreamPtr stream, Handler handler, DispatcherOptions options = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void Start();

  // Waits for the worker to finish; the stream must be closed first.
  void Join();

  // True when called from inside this dispatcher's handler.
  bool OnWorkerThread() const {
    return thread_.get_id() == std::this_thread::get_id();
  }

  uint64_t Succeeded() const {
    return succeeded_.load();
  }
  uint64_t Failed() const {
    return failed_.load();
  }
  uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  void Run();
  void Requeue(Delivery delivery);

  StreamPtr         stream_;
  Handler           handler_;
  DispatcherOptions options_;

  std::thread           thread_;
  std::atomic<uint64_t> succeeded_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace cacheq::queue
