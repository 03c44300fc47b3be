#pragma once

#include <cstdint>

namespace cacheq::model {

enum class StreamState : std::uint8_t {
  kUncreated = 0,
  kActive    = 1,
  kDraining  = 2,
  kStopped   = 3,
};

constexpr bool IsTerminal(StreamState state) {
  return state == StreamState::kStopped;
}

// Streams only move forward: UNCREATED -> ACTIVE -> DRAINING -> STOPPED.
constexpr bool CanTransition(StreamState from, StreamState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr const char* ToString(StreamState state) {
  switch (state) {
    case StreamState::kUncreated:
      return "uncreated";
    case StreamState::kActive:
      return "active";
    case StreamState::kDraining:
      return "draining";
    case StreamState::kStopped:
      return "stopped";
  }
  return "unknown";
}

} // namespace cacheq::model
