#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace outflow::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), connection_lock_(db_->ConnectionMutex(), std::defer_lock) {
  if (!connection_lock_.try_lock_for(db_->Options().busy_timeout)) {
    throw SerializationError("sqlite: timed out waiting for the connection");
  }

  std::string error;
  const int   rc = db_->TryExec("BEGIN IMMEDIATE;", &error);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw SerializationError("sqlite begin: " + error);
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite begin: " + error);
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  std::string error;
  if (db_->TryExec("ROLLBACK;", &error) != SQLITE_OK) {
    OUTFLOW_LOG_WARN("sqlite rollback failed", {observability::StringField("error", error)});
  }
}

void SqliteTransaction::Commit() {
  std::string error;
  const int   rc = db_->TryExec("COMMIT;", &error);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw SerializationError("sqlite commit: " + error);
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite commit: " + error);
  }
  committed_ = true;
  finished_  = true;
  connection_lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
  connection_lock_.unlock();
}

} // namespace outflow::db::sqlite
