#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace fieldwake::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  For callers that cannot continue after a failed write.
*/
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const auto what = context + (result.message.empty() ? std::string{} : ": " + result.message);
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(what);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(what);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::Unavailable(what);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(what);
    default:
      throw std::runtime_error(what);
  }
}

} // namespace fieldwake::db
