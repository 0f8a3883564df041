#pragma once

#include <string>
#include <string_view>

namespace baton::db {

/*
  Backend-neutral outcome of a repository write.

  Repositories translate sqlite (or any other backend) errors into these
  codes; nothing above internal/db sees a backend error type.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  // Duplicate primary key, including a reused event dedup key.
  AlreadyExists,
  // Foreign key or check constraint, e.g. a task group for an unknown session.
  ConstraintViolation,

  // Lock contention; the caller may retry the whole transaction.
  Busy,
  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::IOError;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace baton::db
