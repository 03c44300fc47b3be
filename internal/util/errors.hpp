#pragma once

#include <stdexcept>
#include <string>

namespace cacheq::util {

/*
  Central error types.

  Every backend reports failures with these so callers can handle
  "memory" and "redis" the same way.
*/

// Key absent or expired (also used where the contract says NotExist).
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Value has no canonical string form.
class EncodingError : public std::runtime_error {
 public:
  explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Counter operation on a value that is not an integer.
class TypeError : public std::runtime_error {
 public:
  explicit TypeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedOperation : public std::runtime_error {
 public:
  explicit UnsupportedOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockContention : public std::runtime_error {
 public:
  explicit LockContention(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockNotHeld : public LockContention {
 public:
  explicit LockNotHeld(const std::string& msg) : LockContention(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Engine unreachable or connection broken.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Error reply from the engine that has no more specific mapping.
class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace cacheq::util
