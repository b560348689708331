#include "errors.hpp"

#include <sstream>

namespace outflow::util {
namespace {

std::string Render(ErrorCode code, const std::string& message, const ErrorContext& context) {
  std::ostringstream out;
  out << ToString(code) << ": " << message;

  bool open = false;
  auto field = [&](const char* key, const std::string& value) {
    if (value.empty()) return;
    out << (open ? " " : " (") << key << '=' << value;
    open = true;
  };
  field("request_id", context.request_id);
  field("spare_part_id", context.spare_part_id);
  field("store_id", context.store_id);
  if (context.requested != 0 || context.available != 0 || context.shortfall != 0) {
    field("requested", std::to_string(context.requested));
    field("available", std::to_string(context.available));
    field("shortfall", std::to_string(context.shortfall));
  }
  if (open) out << ')';
  return out.str();
}

} // namespace

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInsufficientStock:
      return "insufficient stock";
    case ErrorCode::kLimitExceeded:
      return "limit exceeded";
    case ErrorCode::kInvalidTransition:
      return "invalid transition";
    case ErrorCode::kStaleState:
      return "stale state";
    case ErrorCode::kNotFound:
      return "not found";
    case ErrorCode::kProtectedRoleViolation:
      return "protected role violation";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kAlreadyExists:
      return "already exists";
    case ErrorCode::kCancelled:
      return "cancelled";
  }
  return "error";
}

Error::Error(ErrorCode code, std::string message, ErrorContext context)
    : std::runtime_error(Render(code, message, context)), code_(code), message_(std::move(message)), context_(std::move(context)) {
}

} // namespace outflow::util
