#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cacheq::cache::redis {

/*
  RESP2 codec.

  Requests are always arrays of bulk strings. Replies are decoded into a
  Reply tree; RESP3 null ('_') is accepted as nil for servers that send it.
*/

enum class ReplyType {
  kNil,
  kSimpleString,
  kError,
  kInteger,
  kBulkString,
  kArray,
};

struct Reply {
  ReplyType          type = ReplyType::kNil;
  std::string        str;
  int64_t            integer = 0;
  std::vector<Reply> elements;

  bool IsNil() const {
    return type == ReplyType::kNil;
  }
  bool IsError() const {
    return type == ReplyType::kError;
  }
  bool IsArray() const {
    return type == ReplyType::kArray;
  }
};

// *N\r\n followed by N bulk strings
std::string EncodeCommand(const std::vector<std::string>& args);

/*
  Decodes one reply from the front of data.

  Returns nullopt when data does not yet hold a complete reply; on success
  *consumed is the number of bytes the reply occupied. Throws
  util::ProtocolError on malformed input.
*/
std::optional<Reply> ParseReply(std::string_view data, std::size_t* consumed);

} // namespace cacheq::cache::redis
