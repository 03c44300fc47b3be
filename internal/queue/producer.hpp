#pragma once

#include <memory>
#include <string>

#include "internal/model/message.hpp"
#include "queue_registry.hpp"

namespace cacheq::queue {

/*
  Appends messages to in-process streams.

  The caller's message is copied and given a fresh delivery id; the copy
  is handed to the stream's channel without blocking the caller.
*/
class Producer {
 public:
  explicit Producer(std::shared_ptr<QueueRegistry> registry);

  // Returns the assigned id. Throws util::InvalidState once streams are closed.
  std::string Append(const model::Message& message);

 private:
  std::shared_ptr<QueueRegistry> registry_;
};

} // namespace cacheq::queue
