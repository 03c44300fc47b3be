#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "channel.hpp"
#include "delivery.hpp"
#include "internal/model/stream_state.hpp"

namespace cacheq::queue {

/*
  A named in-process stream: one channel shared by every producer and
  every dispatcher registered under the name.
*/
class Stream {
 public:
  Stream(std::string name, std::size_t capacity);

  const std::string& Name() const {
    return name_;
  }

  Channel<Delivery>& Messages() {
    return channel_;
  }

  model::StreamState State() const {
    return state_.load();
  }

  // Moves the stream forward; returns false if the transition is not allowed.
  bool Advance(model::StreamState to);

 private:
  std::string                     name_;
  Channel<Delivery>               channel_;
  std::atomic<model::StreamState> state_{model::StreamState::kUncreated};
};

using StreamPtr = std::shared_ptr<Stream>;

} // namespace cacheq::queue
