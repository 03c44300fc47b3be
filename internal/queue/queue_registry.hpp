#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "stream.hpp"

namespace cacheq::queue {

/*
  Stream name → stream, created on first use.

  Streams live until CloseAll(); after that no new stream can be created.
*/
class QueueRegistry {
 public:
  explicit QueueRegistry(std::size_t capacity = 0);

  // Throws util::InvalidState after CloseAll().
  StreamPtr GetOrCreate(const std::string& name);

  // nullptr when the stream was never used.
  StreamPtr Find(const std::string& name) const;

  std::vector<std::string> Names() const;

  // ACTIVE → DRAINING for every stream; closes their channels.
  void CloseAll();

  // DRAINING → STOPPED for every stream, once its consumers are gone.
  void MarkStopped();

  bool Closed() const;

 private:
  const std::size_t capacity_;

  mutable std::shared_mutex                  mutex_;
  std::unordered_map<std::string, StreamPtr> streams_;
  bool                                       closed_ = false;
};

} // namespace cacheq::queue
