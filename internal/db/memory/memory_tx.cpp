#include "memory_tx.hpp"

#include <stdexcept>

namespace outflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Write(const std::string& row, Apply apply) {
  if (committed_ || rolled_back_) {
    throw std::logic_error("write after transaction end");
  }
  apply(working_);
  if (!row.empty()) rows_.insert(row);
  writes_.push_back(std::move(apply));
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("commit after rollback");
  }
  auto stamp = [](const MemoryRepository::State& state, const std::string& row) -> uint64_t {
    auto it = state.row_stamps.find(row);
    return it == state.row_stamps.end() ? 0 : it->second;
  };

  std::scoped_lock lock(repo_.mutex_);
  // working_ never bumps stamps, so it still holds the snapshot's values.
  for (const auto& row : rows_) {
    if (stamp(repo_.committed_, row) != stamp(working_, row)) {
      throw SerializationError("transaction conflict: " + row + " was modified by a concurrent transaction");
    }
  }
  for (const auto& apply : writes_) {
    apply(repo_.committed_);
  }
  for (const auto& row : rows_) {
    ++repo_.committed_.row_stamps[row];
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace outflow::db::memory
