#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/inventory.hpp"
#include "internal/util/retry.hpp"

namespace outflow::inventory {

/*
  One stock mutation.

  quantity is the signed change to current_stock: positive for IN, negative
  for OUT, either sign for TRANSFER and ADJUSTMENT. reserved_delta and
  damaged_delta move the level's reserved and quarantine counters in the same
  write; only the reservation manager and the return path set them.
*/
struct MovementRequest {
  model::LevelKey          key;
  model::MovementType      type     = model::MovementType::kUnspecified;
  model::Quantity          quantity = 0;
  model::MovementReference reference;
  model::Quantity          reserved_delta = 0;
  model::Quantity          damaged_delta  = 0;
};

struct MovementResult {
  model::InventoryLevel level;
  model::StockMovement  movement;
};

struct Availability {
  bool            available       = false;
  model::Quantity available_stock = 0;
  model::Quantity reserved_stock  = 0;
  model::Quantity total_stock     = 0;
};

/*
  Authoritative stock ledger.

  Every change to current_stock goes through ApplyMovement / ApplyMovementInTx
  and appends exactly one StockMovement, so Replay() of a key always equals its
  current_stock.

  Locking: one in-process mutex per (part, store). Callers that need several
  keys take them through LockKeys(), which orders them. Within a key the
  repository's row version and transaction commit detect lost races, which
  surface as util::StaleState and are retried under the RetryPolicy.
*/
class InventoryLedger {
 public:
  InventoryLedger(std::shared_ptr<db::Repository> repository, util::RetryPolicy retry);

  std::optional<model::InventoryLevel> GetLevel(const model::LevelKey& key);

  MovementResult ApplyMovement(const model::LevelKey& key, model::MovementType type, model::Quantity quantity,
                               const model::MovementReference& reference);
  MovementResult ApplyMovement(const MovementRequest& request);

  // Caller holds the key lock and owns the transaction.
  MovementResult ApplyMovementInTx(db::Transaction& tx, const MovementRequest& request);

  model::InventoryLevel InitializeLevel(const model::LevelKey& key, model::Quantity initial_stock, const std::string& actor);
  MovementResult        ReceiveStock(const model::LevelKey& key, model::Quantity quantity, model::Money unit_cost, const std::string& reference_id,
                                     const std::string& actor);
  std::optional<MovementResult> AdjustToCount(const model::LevelKey& key, model::Quantity physical_count, const std::string& reason,
                                              const std::string& actor);
  std::vector<model::StockMovement> Transfer(const std::string& spare_part_id, const std::string& from_store_id, const std::string& to_store_id,
                                             model::Quantity quantity, const std::string& actor);

  Availability                      CheckAvailability(const model::LevelKey& key, model::Quantity quantity);
  std::vector<model::StockMovement> Movements(const model::LevelKey& key);
  model::Quantity                   Replay(const model::LevelKey& key);

  std::unique_lock<std::mutex>              LockKey(const model::LevelKey& key);
  std::vector<std::unique_lock<std::mutex>> LockKeys(std::vector<model::LevelKey> keys);

  const util::RetryPolicy& Retry() const {
    return retry_;
  }

 private:
  std::shared_ptr<std::mutex> KeyMutex(const model::LevelKey& key);
  void                        WarnIfLowStock(db::Transaction& tx, const model::InventoryLevel& level);

  std::shared_ptr<db::Repository> repository_;
  util::RetryPolicy               retry_;

  std::mutex                                                key_mutexes_guard_;
  std::map<model::LevelKey, std::shared_ptr<std::mutex>>    key_mutexes_;
};

} // namespace outflow::inventory
