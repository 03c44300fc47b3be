#pragma once

#include <string>

#include "resp.hpp"

namespace cacheq::cache::redis {

/*
  Translates engine error replies into the util error types.

    NOTEXIST ...            → util::NotFound
    WRONGTYPE / not an integer / overflow → util::TypeError
    anything else           → util::EngineError
*/
Reply CheckReply(Reply reply, const std::string& op);

} // namespace cacheq::cache::redis
