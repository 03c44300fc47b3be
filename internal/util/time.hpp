#pragma once

#include <chrono>

#include <google/protobuf/duration.pb.h>

namespace cacheq::util {

/*
  Clock source for entry expiry and config durations.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

/*
  base + d without overflowing the clock's tick count.

  Durations past the clock's range saturate to TimePoint::max(); a
  non-positive d yields base itself.
*/
template <typename Rep, typename Period>
TimePoint AddSaturating(TimePoint base, std::chrono::duration<Rep, Period> d) {
  if (d.count() <= 0) {
    return base;
  }

  // headroom rounded down into d's unit, so the comparison cannot overflow
  const auto headroom = std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(TimePoint::max() - base);
  if (d >= headroom) {
    return TimePoint::max();
  }
  return base + std::chrono::duration_cast<Clock::duration>(d);
}

// Expiry time for an entry that lives for d from now.
template <typename Rep, typename Period>
TimePoint ExpiryAfter(std::chrono::duration<Rep, Period> d) {
  return AddSaturating(Now(), d);
}

// Negative durations clamp to zero.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

// Returns fallback when the duration is unset, zero or negative.
std::chrono::milliseconds FromProtoOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace cacheq::util
