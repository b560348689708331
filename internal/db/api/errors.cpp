#include "errors.hpp"

#include <stdexcept>

namespace outflow::db {

void ThrowIfDbError(const Result& result, const std::string& context, util::ErrorContext error_context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message, std::move(error_context));
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message, std::move(error_context));
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
    case ErrorCode::Busy:
      throw util::StaleState(message, std::move(error_context));
    default:
      throw std::runtime_error(message);
  }
}

void CommitOrThrow(Transaction& tx, const std::string& context, util::ErrorContext error_context) {
  try {
    tx.Commit();
  } catch (const SerializationError& e) {
    throw util::StaleState(context + ": " + e.what(), std::move(error_context));
  }
}

} // namespace outflow::db
