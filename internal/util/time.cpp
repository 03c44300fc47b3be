#include "time.hpp"

namespace cacheq::util {

TimePoint Now() {
  return Clock::now();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  const auto total = std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos());

  // negative durations in config mean "not set"
  if (total.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(total);
}

std::chrono::milliseconds FromProtoOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = FromProto(d);
  return ms.count() > 0 ? ms : fallback;
}

} // namespace cacheq::util
