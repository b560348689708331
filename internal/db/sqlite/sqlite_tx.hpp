#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace outflow::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection mutex for its whole lifetime and uses BEGIN IMMEDIATE:
    - grabs the write lock early
    - a second writer process fails after busy_timeout instead of deadlocking

  A thread must not open a second transaction while it holds one.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::timed_mutex> connection_lock_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace outflow::db::sqlite
