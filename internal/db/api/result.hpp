#pragma once

#include <stdexcept>
#include <string>

namespace outflow::db {

/*
  Backend-neutral outcome of a repository call.

  Backends translate their native errors into these codes; ThrowIfDbError
  maps them onto the engine's typed exceptions. Conflict is a failed
  version compare-and-set on a level or request row.
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

// Thrown by Transaction::Commit when another writer won the race.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace outflow::db
