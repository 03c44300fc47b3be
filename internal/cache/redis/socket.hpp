#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cacheq::cache::redis {

/*
  RAII wrapper for a blocking POSIX TCP socket.

  Owns the descriptor and closes it on destruction. Move-only.
*/
class Socket {
 public:
  Socket() noexcept = default;
  explicit Socket(int fd) noexcept;
  ~Socket();

  Socket(const Socket&)            = delete;
  Socket& operator=(const Socket&) = delete;

  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;

  // Resolves host and connects within timeout. Throws util::Unavailable.
  static Socket Connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

  // 0 disables the timeout.
  void SetReadTimeout(std::chrono::milliseconds timeout);

  // Throws util::Unavailable.
  void WriteAll(const std::string& data);

  // Returns bytes read (> 0). Throws util::Unavailable on EOF, error or timeout.
  std::size_t ReadSome(char* buffer, std::size_t size);

  bool valid() const noexcept {
    return fd_ != -1;
  }

  int fd() const noexcept {
    return fd_;
  }

  void Close() noexcept;

 private:
  int fd_ = -1;
};

} // namespace cacheq::cache::redis
