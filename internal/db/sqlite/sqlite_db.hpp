#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace outflow::db::sqlite {

struct SqliteOptions {
  bool                      wal_mode     = true;
  std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000);
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the process. A transaction owns it exclusively
  between BEGIN and COMMIT/ROLLBACK; other threads wait on the connection
  mutex for at most busy_timeout.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  std::timed_mutex& ConnectionMutex() {
    return connection_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations); throws on failure
  void Exec(const std::string& sql);

  // Execute a SQL string and hand back the sqlite result code
  int TryExec(const std::string& sql, std::string* error);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*         db_ = nullptr;
  std::string      path_;
  SqliteOptions    options_;
  std::timed_mutex connection_mutex_;
};

// Creates every table and index the repository needs; idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace outflow::db::sqlite
