#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace outflow::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    OUTFLOW_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    finished_ = true;
    throw SerializationError(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  tx_->abort();
}

} // namespace outflow::db::postgres
