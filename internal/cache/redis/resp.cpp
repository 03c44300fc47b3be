#include "resp.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

#include "internal/util/errors.hpp"

namespace cacheq::cache::redis {

namespace {

constexpr std::size_t      kMaxDepth = 8;
// engine default proto-max-bulk-len
constexpr int64_t          kMaxBulkLength = 512 * 1024 * 1024;
// smallest encoded element ("_\r\n"), bounds reserve()
constexpr std::size_t      kMinElementSize = 3;
constexpr std::string_view kSep      = "\r\n";

void AddBulk(std::string& payload, std::string_view data) {
  payload += '$';
  payload += std::to_string(data.size());
  payload.append(kSep);
  payload.append(data);
  payload.append(kSep);
}

int64_t ParseInteger(std::string_view s) {
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
    throw util::ProtocolError("resp: invalid integer \"" + std::string(s) + "\"");
  }
  return v;
}

// nullopt = need more data
std::optional<Reply> ParseAt(std::string_view data, std::size_t& pos, std::size_t depth) {
  if (depth > kMaxDepth) {
    throw util::ProtocolError("resp: reply nesting exceeds maximum depth");
  }

  auto crlf = data.find(kSep, pos);
  if (crlf == std::string_view::npos) return std::nullopt;

  if (crlf == pos) {
    throw util::ProtocolError("resp: empty reply line");
  }

  const char type = data[pos];
  const auto body = data.substr(pos + 1, crlf - pos - 1);
  std::size_t next = crlf + kSep.size();

  Reply reply;
  switch (type) {
    case '+':
      reply.type = ReplyType::kSimpleString;
      reply.str  = std::string(body);
      break;

    case '-':
      reply.type = ReplyType::kError;
      reply.str  = std::string(body);
      break;

    case ':':
      reply.type    = ReplyType::kInteger;
      reply.integer = ParseInteger(body);
      break;

    case '_':
      reply.type = ReplyType::kNil;
      break;

    case '$': {
      const auto len = ParseInteger(body);
      if (len < 0) {
        reply.type = ReplyType::kNil;
        break;
      }
      if (len > kMaxBulkLength) {
        throw util::ProtocolError("resp: bulk string length " + std::to_string(len) + " exceeds limit");
      }
      const auto size = static_cast<std::size_t>(len);
      if (data.size() - next < size + kSep.size()) return std::nullopt;
      if (data.substr(next + size, kSep.size()) != kSep) {
        throw util::ProtocolError("resp: bulk string is not terminated by CRLF");
      }
      reply.type = ReplyType::kBulkString;
      reply.str  = std::string(data.substr(next, size));
      next += size + kSep.size();
      break;
    }

    case '*': {
      const auto count = ParseInteger(body);
      if (count < 0) {
        reply.type = ReplyType::kNil;
        break;
      }
      reply.type = ReplyType::kArray;

      // never reserve more elements than the buffered bytes could hold
      const auto available = (data.size() - next) / kMinElementSize;
      reply.elements.reserve(std::min(static_cast<std::size_t>(count), available));
      for (int64_t i = 0; i < count; ++i) {
        auto element = ParseAt(data, next, depth + 1);
        if (!element) return std::nullopt;
        reply.elements.push_back(std::move(*element));
      }
      break;
    }

    default:
      throw util::ProtocolError(std::string("resp: unsupported reply type '") + type + "'");
  }

  pos = next;
  return reply;
}

} // namespace

std::string EncodeCommand(const std::vector<std::string>& args) {
  std::string payload;
  payload += '*';
  payload += std::to_string(args.size());
  payload.append(kSep);
  for (const auto& arg : args) {
    AddBulk(payload, arg);
  }
  return payload;
}

std::optional<Reply> ParseReply(std::string_view data, std::size_t* consumed) {
  std::size_t pos   = 0;
  auto        reply = ParseAt(data, pos, 0);
  if (reply && consumed) {
    *consumed = pos;
  }
  return reply;
}

} // namespace cacheq::cache::redis
