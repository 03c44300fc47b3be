#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace cacheq::queue {

/*
  Thread-safe FIFO shared by any number of producers and consumers.

  capacity bounds the receive buffer (0 = unbounded). Post() never blocks:
  when the buffer is full the item is parked and moves into the buffer, in
  order, as consumers free space. Close() stops new posts; consumers still
  drain what was accepted before Receive() reports the end.
*/
template <typename T>
class Channel {
 public:
  explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {
  }

  Channel(const Channel&)            = delete;
  Channel& operator=(const Channel&) = delete;

  // Returns false once the channel is closed.
  bool Post(T item) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return false;

      if (capacity_ == 0 || buffer_.size() < capacity_) {
        buffer_.push_back(std::move(item));
      } else {
        parked_.push_back(std::move(item));
      }
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait; nullopt once closed and drained
  std::optional<T> Receive() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return closed_ || !buffer_.empty(); });

    return PopLocked();
  }

  // nullopt on timeout or once closed and drained
  std::optional<T> ReceiveFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);

    if (!cv_.wait_for(lock, timeout, [&] { return closed_ || !buffer_.empty(); })) {
      return std::nullopt;
    }

    return PopLocked();
  }

  // Waits until the buffer has room for at least one item.
  // Returns false on timeout; always true for unbounded channels.
  bool WaitForSpace(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return space_cv_.wait_for(lock, timeout, [&] { return closed_ || HasSpaceLocked(); }) && HasSpaceLocked();
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
    space_cv_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Buffered plus parked items.
  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return buffer_.size() + parked_.size();
  }

  std::size_t Capacity() const noexcept {
    return capacity_;
  }

 private:
  bool HasSpaceLocked() const {
    return capacity_ == 0 || buffer_.size() + parked_.size() < capacity_;
  }

  std::optional<T> PopLocked() {
    if (buffer_.empty()) return std::nullopt;

    T item = std::move(buffer_.front());
    buffer_.pop_front();

    // parked items are only present while the buffer is full
    if (!parked_.empty()) {
      buffer_.push_back(std::move(parked_.front()));
      parked_.pop_front();
    }

    space_cv_.notify_one();
    return item;
  }

  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable space_cv_;
  std::deque<T>           buffer_;
  std::deque<T>           parked_;
  bool                    closed_ = false;
};

} // namespace cacheq::queue
