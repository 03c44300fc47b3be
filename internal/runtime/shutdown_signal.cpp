#include "shutdown_signal.hpp"

namespace cacheq::runtime {

bool ShutdownSignal::Trigger() {
  {
    std::lock_guard lock(mutex_);
    if (triggered_) return false;
    triggered_ = true;
  }
  cv_.notify_all();
  return true;
}

bool ShutdownSignal::Triggered() const {
  std::lock_guard lock(mutex_);
  return triggered_;
}

void ShutdownSignal::Wait() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return triggered_; });
}

bool ShutdownSignal::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return triggered_; });
}

} // namespace cacheq::runtime
