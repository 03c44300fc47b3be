#include "socket.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

#include "internal/util/errors.hpp"

namespace cacheq::cache::redis {

namespace {

std::string ErrnoMessage(const std::string& prefix, int err) {
  return prefix + ": " + std::strerror(err);
}

// Non-blocking connect bounded by timeout; leaves the socket blocking.
bool ConnectWithTimeout(int fd, const sockaddr* addr, socklen_t len, std::chrono::milliseconds timeout, int* err) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    *err = errno;
    return false;
  }

  int rc = ::connect(fd, addr, len);
  if (rc < 0 && errno != EINPROGRESS) {
    *err = errno;
    return false;
  }

  if (rc < 0) {
    pollfd pfd{fd, POLLOUT, 0};
    const int timeout_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;

    do {
      rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
      *err = ETIMEDOUT;
      return false;
    }
    if (rc < 0) {
      *err = errno;
      return false;
    }

    int       so_error = 0;
    socklen_t so_len   = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
      *err = errno;
      return false;
    }
    if (so_error != 0) {
      *err = so_error;
      return false;
    }
  }

  if (::fcntl(fd, F_SETFL, flags) < 0) {
    *err = errno;
    return false;
  }
  return true;
}

} // namespace

Socket::Socket(int fd) noexcept : fd_(fd) {
}

Socket::~Socket() {
  Close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    Close();
    fd_       = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void Socket::Close() noexcept {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

Socket Socket::Connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*  raw     = nullptr;
  const auto service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw); rc != 0) {
    throw util::Unavailable("resolve " + host + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> results(raw, &::freeaddrinfo);

  int last_err = ECONNREFUSED;
  for (auto* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
    Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!sock.valid()) {
      last_err = errno;
      continue;
    }

    if (!ConnectWithTimeout(sock.fd(), ai->ai_addr, ai->ai_addrlen, timeout, &last_err)) {
      continue;
    }

    int one = 1;
    if (::setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
      last_err = errno;
      continue;
    }
    return sock;
  }

  throw util::Unavailable(ErrnoMessage("connect " + host + ":" + service, last_err));
}

void Socket::SetReadTimeout(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    throw util::Unavailable(ErrnoMessage("set read timeout", errno));
  }
}

void Socket::WriteAll(const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw util::Unavailable(ErrnoMessage("write", errno));
    }
    sent += static_cast<std::size_t>(n);
  }
}

std::size_t Socket::ReadSome(char* buffer, std::size_t size) {
  for (;;) {
    const auto n = ::recv(fd_, buffer, size, 0);
    if (n > 0) return static_cast<std::size_t>(n);
    if (n == 0) throw util::Unavailable("read: connection closed by peer");
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) throw util::Unavailable("read: timed out");
    throw util::Unavailable(ErrnoMessage("read", errno));
  }
}

} // namespace cacheq::cache::redis
