#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace upload::db {

/*
  Portable DB result codes.

  Backends translate their native errors into these; the session registry
  turns them into util:: exceptions. Nothing above the repository sees
  pqxx or sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  IOError,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
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

  // Worth re-running the whole transaction.
  bool IsRetryable() const {
    return code == ErrorCode::Conflict || code == ErrorCode::Busy;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace upload::db
