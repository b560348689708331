#include "reservation_manager.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace outflow::reservation {

using model::LevelKey;
using model::Quantity;
using model::ReservationStatus;
using model::StockReservation;

namespace {

LevelKey KeyOf(const StockReservation& reservation) {
  return {reservation.spare_part_id, reservation.store_id};
}

util::ErrorContext ReservationContext(const StockReservation& reservation) {
  util::ErrorContext context;
  context.request_id    = reservation.request_id;
  context.spare_part_id = reservation.spare_part_id;
  context.store_id      = reservation.store_id;
  context.requested     = reservation.reserved_quantity;
  return context;
}

} // namespace

ReservationManager::ReservationManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<inventory::InventoryLedger> ledger,
                                       std::chrono::milliseconds default_ttl)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), default_ttl_(default_ttl) {
}

std::optional<StockReservation> ReservationManager::Get(const std::string& reservation_id) {
  auto tx = repository_->Begin();
  return repository_->GetReservation(*tx, reservation_id);
}

std::optional<StockReservation> ReservationManager::ActiveFor(db::Transaction& tx, const std::string& request_id) {
  return repository_->GetActiveReservation(tx, request_id);
}

StockReservation ReservationManager::LoadActive(db::Transaction& tx, const std::string& reservation_id) {
  auto reservation = repository_->GetReservation(tx, reservation_id);
  if (!reservation) {
    throw util::NotFound("reservation " + reservation_id + " not found");
  }
  if (reservation->status != ReservationStatus::kActive) {
    throw util::InvalidTransition("reservation " + reservation_id + " is " + model::ToString(reservation->status) + ", not Active",
                                  ReservationContext(*reservation));
  }
  return *reservation;
}

void ReservationManager::MoveReserved(db::Transaction& tx, const LevelKey& key, Quantity delta) {
  util::ErrorContext context;
  context.spare_part_id = key.spare_part_id;
  context.store_id      = key.store_id;
  context.requested     = delta;

  auto level = repository_->GetLevel(tx, key);
  if (!level) {
    throw util::NotFound("no inventory level for " + key.ToString(), std::move(context));
  }
  if (delta > 0 && level->available_stock() < delta) {
    context.available = level->available_stock();
    context.shortfall = delta - level->available_stock();
    throw util::InsufficientStock("insufficient available stock for " + key.ToString(), std::move(context));
  }
  if (level->reserved_stock + delta < 0) {
    throw std::logic_error("reserved stock for " + key.ToString() + " would drop below zero");
  }

  level->reserved_stock += delta;
  db::ThrowIfDbError(repository_->UpdateLevel(tx, *level), "update reserved stock", std::move(context));
}

void ReservationManager::Finish(db::Transaction& tx, StockReservation& reservation, ReservationStatus status, const std::string& reason) {
  reservation.status         = status;
  reservation.release_reason = reason;
  reservation.updated_at_ms  = util::NowMs();
  db::ThrowIfDbError(repository_->UpdateReservation(tx, reservation), "update reservation", ReservationContext(reservation));
}

StockReservation ReservationManager::Reserve(const std::string& request_id, const LevelKey& key, Quantity quantity, const std::string& reserved_for) {
  auto key_lock = ledger_->LockKey(key);
  return util::WithRetry(ledger_->Retry(), [&] {
    auto tx          = repository_->Begin();
    auto reservation = ReserveInTx(*tx, request_id, key, quantity, reserved_for);
    db::CommitOrThrow(*tx, "reserve " + key.ToString(), ReservationContext(reservation));
    return reservation;
  });
}

StockReservation ReservationManager::ReserveInTx(db::Transaction& tx, const std::string& request_id, const LevelKey& key, Quantity quantity,
                                                 const std::string& reserved_for) {
  if (quantity <= 0) {
    util::ErrorContext context;
    context.request_id    = request_id;
    context.spare_part_id = key.spare_part_id;
    context.store_id      = key.store_id;
    context.requested     = quantity;
    throw util::InvalidArgument("reservation quantity must be positive", std::move(context));
  }
  if (auto existing = repository_->GetActiveReservation(tx, request_id)) {
    throw util::InvalidTransition("request " + request_id + " already holds active reservation " + existing->id, ReservationContext(*existing));
  }

  try {
    MoveReserved(tx, key, quantity);
  } catch (const util::Error& e) {
    e.RethrowWithRequest(request_id);
  }

  const auto       now_ms = util::NowMs();
  StockReservation reservation;
  reservation.id                = util::GenerateId();
  reservation.request_id        = request_id;
  reservation.spare_part_id     = key.spare_part_id;
  reservation.store_id          = key.store_id;
  reservation.reserved_quantity = quantity;
  reservation.reserved_for      = reserved_for;
  reservation.status            = ReservationStatus::kActive;
  reservation.reserved_at_ms    = now_ms;
  reservation.expires_at_ms     = now_ms + static_cast<std::uint64_t>(default_ttl_.count());
  reservation.updated_at_ms     = now_ms;
  db::ThrowIfDbError(repository_->InsertReservation(tx, reservation), "insert reservation", ReservationContext(reservation));
  OUTFLOW_LOG_DEBUG("stock reserved", {observability::StringField("request_id", request_id), observability::KeyField(key),
                                       observability::IntField("quantity", quantity)});
  return reservation;
}

StockReservation ReservationManager::Extend(const std::string& reservation_id, std::uint64_t new_expires_at_ms) {
  auto current = Get(reservation_id);
  if (!current) {
    throw util::NotFound("reservation " + reservation_id + " not found");
  }

  auto key_lock = ledger_->LockKey(KeyOf(*current));
  return util::WithRetry(ledger_->Retry(), [&] {
    auto tx          = repository_->Begin();
    auto reservation = LoadActive(*tx, reservation_id);
    if (new_expires_at_ms <= reservation.expires_at_ms) {
      throw util::InvalidArgument("new expiry must be later than the current one", ReservationContext(reservation));
    }
    reservation.expires_at_ms = new_expires_at_ms;
    reservation.updated_at_ms = util::NowMs();
    db::ThrowIfDbError(repository_->UpdateReservation(*tx, reservation), "extend reservation", ReservationContext(reservation));
    db::CommitOrThrow(*tx, "extend reservation " + reservation_id, ReservationContext(reservation));
    return reservation;
  });
}

model::StockMovement ReservationManager::Consume(const std::string& reservation_id, const model::MovementReference& reference) {
  auto current = Get(reservation_id);
  if (!current) {
    throw util::NotFound("reservation " + reservation_id + " not found");
  }

  auto key_lock = ledger_->LockKey(KeyOf(*current));
  return util::WithRetry(ledger_->Retry(), [&] {
    auto tx          = repository_->Begin();
    auto reservation = LoadActive(*tx, reservation_id);
    auto movement    = ConsumeInTx(*tx, reservation, reference);
    db::CommitOrThrow(*tx, "consume reservation " + reservation_id, ReservationContext(reservation));
    return movement;
  });
}

model::StockMovement ReservationManager::ConsumeInTx(db::Transaction& tx, StockReservation& reservation, const model::MovementReference& reference) {
  if (reservation.status != ReservationStatus::kActive) {
    throw util::InvalidTransition("reservation " + reservation.id + " is " + model::ToString(reservation.status) + ", not Active",
                                  ReservationContext(reservation));
  }
  if (reservation.IsExpired(util::NowMs())) {
    throw util::InvalidTransition("reservation " + reservation.id + " has expired", ReservationContext(reservation));
  }

  inventory::MovementRequest request;
  request.key            = KeyOf(reservation);
  request.type           = model::MovementType::kOut;
  request.quantity       = -reservation.reserved_quantity;
  request.reserved_delta = -reservation.reserved_quantity;
  request.reference      = reference;

  auto result = util::WithRequest(reservation.request_id, [&] { return ledger_->ApplyMovementInTx(tx, request); });
  Finish(tx, reservation, ReservationStatus::kConsumed, "");
  return result.movement;
}

void ReservationManager::Release(const std::string& reservation_id, const std::string& reason) {
  auto current = Get(reservation_id);
  if (!current) {
    throw util::NotFound("reservation " + reservation_id + " not found");
  }

  auto key_lock = ledger_->LockKey(KeyOf(*current));
  util::WithRetry(ledger_->Retry(), [&] {
    auto tx          = repository_->Begin();
    auto reservation = LoadActive(*tx, reservation_id);
    ReleaseInTx(*tx, reservation, reason);
    db::CommitOrThrow(*tx, "release reservation " + reservation_id, ReservationContext(reservation));
  });
}

void ReservationManager::ReleaseInTx(db::Transaction& tx, StockReservation& reservation, const std::string& reason) {
  if (reservation.status != ReservationStatus::kActive) {
    throw util::InvalidTransition("reservation " + reservation.id + " is " + model::ToString(reservation.status) + ", not Active",
                                  ReservationContext(reservation));
  }
  MoveReserved(tx, KeyOf(reservation), -reservation.reserved_quantity);
  Finish(tx, reservation, ReservationStatus::kReleased, reason);
}

void ReservationManager::ExpireInTx(db::Transaction& tx, StockReservation& reservation) {
  if (reservation.status != ReservationStatus::kActive) {
    throw util::InvalidTransition("reservation " + reservation.id + " is " + model::ToString(reservation.status) + ", not Active",
                                  ReservationContext(reservation));
  }
  MoveReserved(tx, KeyOf(reservation), -reservation.reserved_quantity);
  Finish(tx, reservation, ReservationStatus::kExpired, "expired");
}

std::size_t ReservationManager::ReleaseExpired(std::uint64_t now_ms) {
  std::vector<StockReservation> candidates;
  {
    auto tx = repository_->Begin();
    for (auto& reservation : repository_->ListActiveReservations(*tx)) {
      if (reservation.IsExpired(now_ms)) {
        candidates.push_back(std::move(reservation));
      }
    }
  }

  std::size_t released = 0;
  for (const auto& candidate : candidates) {
    auto key_lock = ledger_->LockKey(KeyOf(candidate));
    const bool expired = util::WithRetry(ledger_->Retry(), [&] {
      auto tx          = repository_->Begin();
      auto reservation = repository_->GetReservation(*tx, candidate.id);
      // Consumed or released since the scan.
      if (!reservation || reservation->status != ReservationStatus::kActive || !reservation->IsExpired(now_ms)) {
        return false;
      }
      ExpireInTx(*tx, *reservation);
      db::CommitOrThrow(*tx, "expire reservation " + candidate.id, ReservationContext(*reservation));
      return true;
    });
    if (expired) {
      ++released;
    }
  }

  if (released > 0) {
    OUTFLOW_LOG_INFO("expired reservations released", {observability::IntField("count", static_cast<std::int64_t>(released))});
  }
  return released;
}

} // namespace outflow::reservation
