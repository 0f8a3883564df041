#pragma once

#include <stdexcept>
#include <string>

namespace baton::util {

/*
  Central error types.

  These get translated later to result tags and gRPC status codes.
*/

// Malformed identifier, payload, or request. Never persisted.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A dedup key reused for a different call. Nothing was written.
class DedupKeyReused : public ValidationError {
 public:
  explicit DedupKeyReused(const std::string& msg) : ValidationError(msg) {
  }
};

// The record already exists. A retry of the same write lands here.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stored state contradicts the requested transition.
class StateInconsistency : public std::runtime_error {
 public:
  explicit StateInconsistency(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend busy, locked or failing I/O. Retryable.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace baton::util
