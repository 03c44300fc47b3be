#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "resp.hpp"
#include "socket.hpp"

namespace cacheq::cache::redis {

struct ConnectionOptions {
  std::string host = "127.0.0.1";
  uint16_t    port = 6379;
  std::string password;
  uint32_t    db = 0;

  std::chrono::milliseconds connect_timeout{5000};
  // 0 = reads wait forever
  std::chrono::milliseconds read_timeout{30000};
};

// Splits "host:port"; the last ':' separates the port. Throws std::invalid_argument.
ConnectionOptions ParseAddress(const std::string& address);

/*
  One synchronous connection to the engine.

  Not thread-safe: a connection is used by one thread at a time (the pool
  hands it out exclusively). After an IO or protocol failure the
  connection is marked broken and must be discarded.
*/
class RedisConnection {
 public:
  // Connects, then AUTH / SELECT as configured. Throws util::Unavailable.
  explicit RedisConnection(ConnectionOptions options);

  RedisConnection(const RedisConnection&)            = delete;
  RedisConnection& operator=(const RedisConnection&) = delete;

  // Error replies are returned, not thrown. Throws util::Unavailable / util::ProtocolError.
  Reply Command(const std::vector<std::string>& args);

  // Sends all commands in one write and reads the replies in order.
  std::vector<Reply> Pipeline(const std::vector<std::vector<std::string>>& commands);

  bool Broken() const {
    return broken_;
  }

  const ConnectionOptions& Options() const {
    return options_;
  }

 private:
  Reply ReadReply();
  void  Handshake();

  ConnectionOptions options_;
  Socket            socket_;
  std::string       buffer_;
  bool              broken_ = false;
};

} // namespace cacheq::cache::redis
