#pragma once

namespace outflow::db {

/*
  Unit of atomicity for the outward flow.

  A stock movement, the level update it implies, the reservation it consumes
  and the request transition that caused it are written in one Transaction,
  so a reader never sees a ledger row without its level change.

  Every backend guarantees:

  - Writes are invisible to other transactions until Commit()
  - Rollback() and the destructor (when not committed) discard all writes
  - Commit() throws SerializationError when a concurrent writer won; the
    caller retries the whole unit

  SQLite: BEGIN IMMEDIATE on a connection held for the transaction
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy, first writer wins
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace outflow::db
