#pragma once

#include <cstdint>

#include "internal/model/message.hpp"

namespace cacheq::queue {

/*
  A message in flight on an in-process stream.

  attempts counts how many times a handler has been given the message.
*/
struct Delivery {
  model::Message message;

  uint32_t attempts = 0;
};

} // namespace cacheq::queue
