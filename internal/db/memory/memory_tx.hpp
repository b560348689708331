#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace outflow::db::memory {

/*
  Transaction = snapshot + write log

  Reads see the snapshot plus this transaction's own writes. Every write names
  the row it touches; Commit fails with SerializationError if another
  transaction committed a write to any of those rows after the snapshot was
  taken. Otherwise the write log is replayed onto the committed state, so
  transactions on disjoint rows never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Apply = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  // Applies the write to the working copy now and to the committed state on
  // Commit. An empty row is an append that cannot conflict.
  void Write(const std::string& row, Apply apply);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::set<std::string>   rows_;
  std::vector<Apply>      writes_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace outflow::db::memory
