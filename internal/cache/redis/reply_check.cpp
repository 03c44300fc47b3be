#include "reply_check.hpp"

#include "internal/util/errors.hpp"

namespace cacheq::cache::redis {

Reply CheckReply(Reply reply, const std::string& op) {
  if (!reply.IsError()) {
    return reply;
  }

  const auto& msg = reply.str;
  if (msg.find("NOTEXIST") != std::string::npos) {
    throw util::NotFound(op + ": " + msg);
  }
  if (msg.rfind("WRONGTYPE", 0) == 0 || msg.find("not an integer") != std::string::npos || msg.find("overflow") != std::string::npos) {
    throw util::TypeError(op + ": " + msg);
  }
  throw util::EngineError(op + ": " + msg);
}

} // namespace cacheq::cache::redis
