#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/model/reservation.hpp"

namespace outflow::reservation {

/*
  Holds stock for approved requests until they are issued.

  The only writer of InventoryLevel::reserved_stock. Reserve, Release and
  expiry move reserved_stock directly (current_stock is untouched, so no
  ledger row); Consume removes the reserved units from both counters with a
  single OUT movement.

  The *InTx variants expect the caller to hold the level's key lock and to
  own the transaction; the plain variants take the lock, open a transaction,
  and retry lost races.
*/
class ReservationManager {
 public:
  ReservationManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<inventory::InventoryLedger> ledger,
                     std::chrono::milliseconds default_ttl);

  model::StockReservation Reserve(const std::string& request_id, const model::LevelKey& key, model::Quantity quantity,
                                  const std::string& reserved_for);
  model::StockReservation ReserveInTx(db::Transaction& tx, const std::string& request_id, const model::LevelKey& key, model::Quantity quantity,
                                      const std::string& reserved_for);

  model::StockReservation Extend(const std::string& reservation_id, std::uint64_t new_expires_at_ms);

  model::StockMovement Consume(const std::string& reservation_id, const model::MovementReference& reference);
  model::StockMovement ConsumeInTx(db::Transaction& tx, model::StockReservation& reservation, const model::MovementReference& reference);

  void Release(const std::string& reservation_id, const std::string& reason);
  void ReleaseInTx(db::Transaction& tx, model::StockReservation& reservation, const std::string& reason);

  // Marks an Active reservation Expired and returns its units to available stock.
  void ExpireInTx(db::Transaction& tx, model::StockReservation& reservation);

  std::size_t ReleaseExpired(std::uint64_t now_ms);

  std::optional<model::StockReservation> Get(const std::string& reservation_id);
  std::optional<model::StockReservation> ActiveFor(db::Transaction& tx, const std::string& request_id);

  std::chrono::milliseconds DefaultTtl() const {
    return default_ttl_;
  }

 private:
  model::StockReservation LoadActive(db::Transaction& tx, const std::string& reservation_id);
  void                    MoveReserved(db::Transaction& tx, const model::LevelKey& key, model::Quantity delta);
  void                    Finish(db::Transaction& tx, model::StockReservation& reservation, model::ReservationStatus status,
                                 const std::string& reason);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<inventory::InventoryLedger> ledger_;
  std::chrono::milliseconds                   default_ttl_;
};

} // namespace outflow::reservation
