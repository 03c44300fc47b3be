#include "redis_connection.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "internal/util/errors.hpp"

namespace cacheq::cache::redis {

ConnectionOptions ParseAddress(const std::string& address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("redis address must be host:port, got \"" + address + "\"");
  }

  const auto digits = std::string_view(address).substr(colon + 1);
  unsigned   port   = 0;
  auto [ptr, ec]    = std::from_chars(digits.data(), digits.data() + digits.size(), port);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || port == 0 || port > 65535) {
    throw std::invalid_argument("redis port out of range in \"" + address + "\"");
  }

  ConnectionOptions options;
  options.host = address.substr(0, colon);
  options.port = static_cast<uint16_t>(port);
  return options;
}

RedisConnection::RedisConnection(ConnectionOptions options) : options_(std::move(options)) {
  socket_ = Socket::Connect(options_.host, options_.port, options_.connect_timeout);
  if (options_.read_timeout.count() > 0) {
    socket_.SetReadTimeout(options_.read_timeout);
  }
  Handshake();
}

void RedisConnection::Handshake() {
  if (!options_.password.empty()) {
    auto reply = Command({"AUTH", options_.password});
    if (reply.IsError()) {
      throw util::Unavailable("redis auth failed: " + reply.str);
    }
  }

  if (options_.db != 0) {
    auto reply = Command({"SELECT", std::to_string(options_.db)});
    if (reply.IsError()) {
      throw util::Unavailable("redis select db " + std::to_string(options_.db) + " failed: " + reply.str);
    }
  }
}

Reply RedisConnection::Command(const std::vector<std::string>& args) {
  auto replies = Pipeline({args});
  return std::move(replies.front());
}

std::vector<Reply> RedisConnection::Pipeline(const std::vector<std::vector<std::string>>& commands) {
  if (broken_) {
    throw util::Unavailable("redis connection is broken");
  }

  std::string payload;
  for (const auto& args : commands) {
    payload += EncodeCommand(args);
  }

  try {
    socket_.WriteAll(payload);

    std::vector<Reply> replies;
    replies.reserve(commands.size());
    for (std::size_t i = 0; i < commands.size(); ++i) {
      replies.push_back(ReadReply());
    }
    return replies;
  } catch (const util::Unavailable&) {
    broken_ = true;
    throw;
  } catch (const util::ProtocolError&) {
    broken_ = true;
    throw;
  }
}

Reply RedisConnection::ReadReply() {
  for (;;) {
    std::size_t consumed = 0;
    if (auto reply = ParseReply(buffer_, &consumed)) {
      buffer_.erase(0, consumed);
      return std::move(*reply);
    }

    char chunk[16 * 1024];
    auto n = socket_.ReadSome(chunk, sizeof(chunk));
    buffer_.append(chunk, n);
  }
}

} // namespace cacheq::cache::redis
