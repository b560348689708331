#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace outflow::util {

/*
  Central error types.

  Each error carries the identifiers and quantities involved so callers can
  report a shortfall without parsing the message. what() renders both.
*/

enum class ErrorCode {
  kInsufficientStock,
  kLimitExceeded,
  kInvalidTransition,
  kStaleState,
  kNotFound,
  kProtectedRoleViolation,
  kInvalidArgument,
  kAlreadyExists,
  kCancelled,
};

const char* ToString(ErrorCode code);

struct ErrorContext {
  std::string  request_id;
  std::string  spare_part_id;
  std::string  store_id;
  std::int64_t requested = 0;
  std::int64_t available = 0;
  std::int64_t shortfall = 0;
};

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ErrorContext context);

  ErrorCode Code() const {
    return code_;
  }
  const ErrorContext& Context() const {
    return context_;
  }
  const std::string& Message() const {
    return message_;
  }

  // Rethrows the same concrete type with request_id filled in.
  [[noreturn]] virtual void RethrowWithRequest(const std::string& request_id) const = 0;

 private:
  ErrorCode    code_;
  std::string  message_;
  ErrorContext context_;
};

template <ErrorCode C>
class TypedError final : public Error {
 public:
  explicit TypedError(std::string message, ErrorContext context = {}) : Error(C, std::move(message), std::move(context)) {
  }

  [[noreturn]] void RethrowWithRequest(const std::string& request_id) const override {
    auto context       = Context();
    context.request_id = request_id;
    throw TypedError(Message(), std::move(context));
  }
};

using InsufficientStock      = TypedError<ErrorCode::kInsufficientStock>;
using LimitExceeded          = TypedError<ErrorCode::kLimitExceeded>;
using InvalidTransition      = TypedError<ErrorCode::kInvalidTransition>;
using StaleState             = TypedError<ErrorCode::kStaleState>;
using NotFound               = TypedError<ErrorCode::kNotFound>;
using ProtectedRoleViolation = TypedError<ErrorCode::kProtectedRoleViolation>;
using InvalidArgument        = TypedError<ErrorCode::kInvalidArgument>;
using AlreadyExists          = TypedError<ErrorCode::kAlreadyExists>;
using Cancelled              = TypedError<ErrorCode::kCancelled>;

/*
  Runs fn and attaches request_id to any engine error escaping it that does
  not already name a request.
*/
template <typename Fn>
auto WithRequest(const std::string& request_id, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const Error& e) {
    if (!e.Context().request_id.empty() || request_id.empty()) {
      throw;
    }
    e.RethrowWithRequest(request_id);
  }
}

} // namespace outflow::util
