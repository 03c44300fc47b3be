#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace cacheq::runtime {

/*
  One-shot completion signal.

  A backend receives one at construction; Run() waits on it and
  Shutdown() triggers it. Several backends may share one signal: a
  trigger releases every Run() waiting on it, and each backend then stops
  its own consumers before its Run() returns. A backend that is not in
  Run() keeps working until its own Shutdown().
*/
class ShutdownSignal {
 public:
  // Returns true only for the call that actually fired the signal.
  bool Trigger();

  bool Triggered() const;

  // blocking wait
  void Wait();

  // Returns true if the signal fired before the timeout.
  bool WaitFor(std::chrono::milliseconds timeout);

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    triggered_ = false;
};

using ShutdownSignalPtr = std::shared_ptr<ShutdownSignal>;

} // namespace cacheq::runtime
