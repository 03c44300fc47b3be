#include "producer.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace cacheq::queue {

Producer::Producer(std::shared_ptr<QueueRegistry> registry) : registry_(std::move(registry)) {
}

std::string Producer::Append(const model::Message& message) {
  if (message.stream.empty()) {
    throw util::InvalidState("append: message has no stream; set message.stream and retry");
  }

  auto stream = registry_->GetOrCreate(message.stream);

  Delivery delivery;
  delivery.message    = message;
  delivery.message.id = util::NewID();

  auto id = delivery.message.id;
  if (!stream->Messages().Post(std::move(delivery))) {
    throw util::InvalidState("append: stream " + message.stream + " is closed; the cache has been shut down");
  }
  return id;
}

} // namespace cacheq::queue
