#include "stream.hpp"

namespace cacheq::queue {

Stream::Stream(std::string name, std::size_t capacity) : name_(std::move(name)), channel_(capacity) {
  state_ = model::StreamState::kActive;
}

bool Stream::Advance(model::StreamState to) {
  auto from = state_.load();
  while (model::CanTransition(from, to)) {
    if (state_.compare_exchange_weak(from, to)) return true;
  }
  return false;
}

} // namespace cacheq::queue
