#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace outflow::db {

/*
  Maps repository results onto engine errors.

  NotFound      -> util::NotFound
  AlreadyExists -> util::AlreadyExists
  Conflict / SerializationFailure / Busy -> util::StaleState (retryable)
  anything else -> std::runtime_error
*/
void ThrowIfDbError(const Result& result, const std::string& context, util::ErrorContext error_context = {});

// Commits tx, turning a lost commit race into util::StaleState.
void CommitOrThrow(Transaction& tx, const std::string& context, util::ErrorContext error_context = {});

} // namespace outflow::db
