#pragma once

#include <map>
#include <string>

#include "internal/model/value.hpp"

namespace cacheq::model {

// Reserved values key used by callers to namespace multi-tenant payloads.
inline constexpr const char* kPrefixKey = "prefix";

using Values = std::map<std::string, Value>;

/*
  One unit of work on a stream.

  id is assigned by the producer when the message is appended; any id set
  by the caller is replaced.
*/
struct Message {
  std::string id;
  std::string stream;
  Values      values;

  // values["prefix"] when it holds a string, empty otherwise.
  std::string GetPrefix() const;
  void        SetPrefix(const std::string& prefix);
};

} // namespace cacheq::model
