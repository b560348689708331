#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace outflow::db::postgres {

/*
  pqxx::work on a pooled connection, READ COMMITTED.

  Lost updates on level and request rows are caught by the version
  compare-and-set in PgRepository; a serialization failure at commit is
  reported as SerializationError so the engine's retry loop picks it up.
  The connection goes back to the pool when the transaction is destroyed.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace outflow::db::postgres
