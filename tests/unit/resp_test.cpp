#include "internal/cache/redis/resp.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/cache/redis/reply_check.hpp"
#include "internal/util/errors.hpp"

namespace {

using cacheq::cache::redis::CheckReply;
using cacheq::cache::redis::EncodeCommand;
using cacheq::cache::redis::ParseReply;
using cacheq::cache::redis::Reply;
using cacheq::cache::redis::ReplyType;

Reply ParseComplete(const std::string& data) {
  std::size_t consumed = 0;
  auto        reply    = ParseReply(data, &consumed);
  assert(reply);
  assert(consumed == data.size());
  return *reply;
}

template <typename E>
bool ParseThrows(const std::string& data) {
  try {
    std::size_t consumed = 0;
    (void)ParseReply(data, &consumed);
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestEncodeCommand() {
  assert(EncodeCommand({"GET", "key"}) == "*2\r\n$3\r\nGET\r\n$3\r\nkey\r\n");
  assert(EncodeCommand({"SET", "k", ""}) == "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");

  // binary-safe
  const std::string binary("a\r\nb", 4);
  assert(EncodeCommand({binary}) == std::string("*1\r\n$4\r\na\r\nb\r\n"));
}

void TestParseScalars() {
  auto ok = ParseComplete("+OK\r\n");
  assert(ok.type == ReplyType::kSimpleString && ok.str == "OK");

  auto err = ParseComplete("-ERR unknown command\r\n");
  assert(err.IsError() && err.str == "ERR unknown command");

  auto integer = ParseComplete(":-12\r\n");
  assert(integer.type == ReplyType::kInteger && integer.integer == -12);

  auto bulk = ParseComplete("$5\r\nhe\r\no\r\n");
  assert(bulk.type == ReplyType::kBulkString && bulk.str == "he\r\no");

  assert(ParseComplete("$-1\r\n").IsNil());
  assert(ParseComplete("*-1\r\n").IsNil());
  assert(ParseComplete("_\r\n").IsNil());
}

void TestParseNestedArray() {
  // XREADGROUP shape: [[stream, [[id, [k, v]]]]]
  auto reply = ParseComplete("*1\r\n*2\r\n$6\r\norders\r\n*1\r\n*2\r\n$3\r\n1-0\r\n*2\r\n$3\r\nsku\r\n$1\r\nA\r\n");
  assert(reply.IsArray() && reply.elements.size() == 1);

  const auto& per_stream = reply.elements[0];
  assert(per_stream.elements[0].str == "orders");

  const auto& entry = per_stream.elements[1].elements[0];
  assert(entry.elements[0].str == "1-0");
  assert(entry.elements[1].elements[0].str == "sku");
  assert(entry.elements[1].elements[1].str == "A");
}

void TestIncompleteInputNeedsMoreData() {
  std::size_t consumed = 0;
  assert(!ParseReply("", &consumed));
  assert(!ParseReply("+OK", &consumed));
  assert(!ParseReply("$5\r\nhel", &consumed));
  assert(!ParseReply("*2\r\n:1\r\n", &consumed));
}

void TestTrailingDataIsLeftForNextReply() {
  std::size_t consumed = 0;
  auto        reply    = ParseReply("+PONG\r\n:1\r\n", &consumed);
  assert(reply && reply->str == "PONG");
  assert(consumed == 7);
}

void TestMalformedInputThrows() {
  using cacheq::util::ProtocolError;
  assert(ParseThrows<ProtocolError>("?what\r\n"));
  assert(ParseThrows<ProtocolError>(":12a\r\n"));
  assert(ParseThrows<ProtocolError>("$3\r\nabcd\r\n"));
  assert(ParseThrows<ProtocolError>("\r\n"));
  assert(ParseThrows<ProtocolError>("*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n:1\r\n"));
}

void TestOversizedLengthsAreBounded() {
  using cacheq::util::ProtocolError;
  assert(ParseThrows<ProtocolError>("$9223372036854775807\r\n"));
  assert(ParseThrows<ProtocolError>("$536870913\r\nabc"));

  // a huge element count only needs more data; nothing is preallocated for it
  std::size_t consumed = 0;
  assert(!ParseReply("*9223372036854775807\r\n", &consumed));
  assert(!ParseReply("*9223372036854775807\r\n:1\r\n:2\r\n", &consumed));

  // a length at the limit is still just incomplete
  assert(!ParseReply("$536870912\r\nabc", &consumed));
}

void TestCheckReplyMapsErrors() {
  Reply ok;
  ok.type = ReplyType::kSimpleString;
  ok.str  = "OK";
  assert(CheckReply(ok, "set").str == "OK");

  auto error = [](const std::string& message) {
    Reply reply;
    reply.type = ReplyType::kError;
    reply.str  = message;
    return reply;
  };

  bool threw = false;
  try {
    CheckReply(error("NOTEXIST ctr not exist"), "incr");
  } catch (const cacheq::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    CheckReply(error("ERR value is not an integer or out of range"), "incr");
  } catch (const cacheq::util::TypeError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    CheckReply(error("WRONGTYPE Operation against a key holding the wrong kind of value"), "get");
  } catch (const cacheq::util::TypeError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    CheckReply(error("NOAUTH Authentication required."), "get");
  } catch (const cacheq::util::EngineError& e) {
    threw = std::string(e.what()).find("NOAUTH") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeCommand();
  TestParseScalars();
  TestParseNestedArray();
  TestIncompleteInputNeedsMoreData();
  TestTrailingDataIsLeftForNextReply();
  TestMalformedInputThrows();
  TestOversizedLengthsAreBounded();
  TestCheckReplyMapsErrors();

  std::cout << "cacheq_unit_resp: pass\n";
  return 0;
}
