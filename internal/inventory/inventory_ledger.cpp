#include "inventory_ledger.hpp"

#include <algorithm>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace outflow::inventory {

using model::LevelKey;
using model::MovementType;
using model::Quantity;

namespace {

util::ErrorContext KeyContext(const LevelKey& key, Quantity requested = 0) {
  util::ErrorContext context;
  context.spare_part_id = key.spare_part_id;
  context.store_id      = key.store_id;
  context.requested     = requested;
  return context;
}

void ValidateDirection(const MovementRequest& request) {
  const bool ok = [&] {
    switch (request.type) {
      case MovementType::kIn:
        return request.quantity > 0;
      case MovementType::kOut:
        return request.quantity < 0;
      case MovementType::kTransfer:
      case MovementType::kAdjustment:
        return request.quantity != 0;
      default:
        return false;
    }
  }();
  if (!ok) {
    throw util::InvalidArgument(std::string("movement ") + model::ToString(request.type) + " cannot carry quantity " +
                                    std::to_string(request.quantity),
                                KeyContext(request.key, request.quantity));
  }
}

} // namespace

InventoryLedger::InventoryLedger(std::shared_ptr<db::Repository> repository, util::RetryPolicy retry)
    : repository_(std::move(repository)), retry_(std::move(retry)) {
}

std::shared_ptr<std::mutex> InventoryLedger::KeyMutex(const LevelKey& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::mutex>();
  }
  return key_mutex;
}

std::unique_lock<std::mutex> InventoryLedger::LockKey(const LevelKey& key) {
  return std::unique_lock<std::mutex>(*KeyMutex(key));
}

std::vector<std::unique_lock<std::mutex>> InventoryLedger::LockKeys(std::vector<LevelKey> keys) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  std::vector<std::unique_lock<std::mutex>> locks;
  locks.reserve(keys.size());
  for (const auto& key : keys) {
    locks.push_back(LockKey(key));
  }
  return locks;
}

std::optional<model::InventoryLevel> InventoryLedger::GetLevel(const LevelKey& key) {
  auto tx = repository_->Begin();
  return repository_->GetLevel(*tx, key);
}

MovementResult InventoryLedger::ApplyMovement(const LevelKey& key, MovementType type, Quantity quantity, const model::MovementReference& reference) {
  MovementRequest request;
  request.key       = key;
  request.type      = type;
  request.quantity  = quantity;
  request.reference = reference;
  return ApplyMovement(request);
}

MovementResult InventoryLedger::ApplyMovement(const MovementRequest& request) {
  ValidateDirection(request);

  auto key_lock = LockKey(request.key);
  return util::WithRetry(retry_, [&] {
    auto tx     = repository_->Begin();
    auto result = ApplyMovementInTx(*tx, request);
    db::CommitOrThrow(*tx, "apply movement " + request.key.ToString(), KeyContext(request.key, request.quantity));
    return result;
  });
}

MovementResult InventoryLedger::ApplyMovementInTx(db::Transaction& tx, const MovementRequest& request) {
  ValidateDirection(request);

  auto level = repository_->GetLevel(tx, request.key);
  if (!level) {
    throw util::NotFound("no inventory level for " + request.key.ToString(), KeyContext(request.key, request.quantity));
  }

  const Quantity previous_stock = level->current_stock;
  const Quantity new_stock      = previous_stock + request.quantity;
  const Quantity new_reserved   = level->reserved_stock + request.reserved_delta;

  if (new_reserved < 0) {
    throw util::InvalidArgument("reserved stock would drop below zero for " + request.key.ToString(), KeyContext(request.key, request.quantity));
  }
  if (new_stock < 0 || new_stock < new_reserved) {
    auto context      = KeyContext(request.key, -request.quantity);
    context.available = level->available_stock();
    context.shortfall = new_reserved - new_stock;
    throw util::InsufficientStock("insufficient stock for " + request.key.ToString(), std::move(context));
  }

  const auto now_ms           = util::NowMs();
  level->current_stock        = new_stock;
  level->reserved_stock       = new_reserved;
  level->damaged_stock       += request.damaged_delta;
  level->last_movement_at_ms  = now_ms;
  db::ThrowIfDbError(repository_->UpdateLevel(tx, *level), "update inventory level", KeyContext(request.key, request.quantity));

  model::StockMovement movement;
  movement.id             = util::GenerateId();
  movement.spare_part_id  = request.key.spare_part_id;
  movement.store_id       = request.key.store_id;
  movement.movement_type  = request.type;
  movement.quantity       = request.quantity;
  movement.previous_stock = previous_stock;
  movement.new_stock      = new_stock;
  movement.unit_cost      = request.reference.unit_cost;
  movement.reference_type = request.reference.reference_type;
  movement.reference_id   = request.reference.reference_id;
  movement.reason         = request.reference.reason;
  movement.created_by     = request.reference.created_by;
  movement.created_at_ms  = now_ms;
  db::ThrowIfDbError(repository_->AppendMovement(tx, movement), "append stock movement", KeyContext(request.key, request.quantity));
  OUTFLOW_LOG_DEBUG("stock movement", {observability::KeyField(request.key), observability::StringField("type", model::ToString(movement.movement_type)),
                                       observability::IntField("quantity", movement.quantity), observability::IntField("new_stock", new_stock)});

  if (request.type == MovementType::kOut) {
    WarnIfLowStock(tx, *level);
  }
  return {*level, movement};
}

void InventoryLedger::WarnIfLowStock(db::Transaction& tx, const model::InventoryLevel& level) {
  auto part = repository_->GetSparePart(tx, level.spare_part_id);
  if (!part || level.current_stock > part->reorder_level) {
    return;
  }
  OUTFLOW_LOG_WARN("stock at or below reorder level", {observability::KeyField(level.Key()), observability::IntField("current_stock", level.current_stock),
                                                        observability::IntField("reorder_level", part->reorder_level)});
}

model::InventoryLevel InventoryLedger::InitializeLevel(const LevelKey& key, Quantity initial_stock, const std::string& actor) {
  if (initial_stock < 0) {
    throw util::InvalidArgument("initial stock must not be negative", KeyContext(key, initial_stock));
  }

  auto key_lock = LockKey(key);
  return util::WithRetry(retry_, [&] {
    auto tx = repository_->Begin();
    if (repository_->GetLevel(*tx, key)) {
      throw util::AlreadyExists("inventory level already exists for " + key.ToString(), KeyContext(key, initial_stock));
    }

    const auto            now_ms = util::NowMs();
    model::InventoryLevel level;
    level.spare_part_id       = key.spare_part_id;
    level.store_id            = key.store_id;
    level.current_stock       = initial_stock;
    level.version             = 1;
    level.last_movement_at_ms = now_ms;
    db::ThrowIfDbError(repository_->InsertLevel(*tx, level), "insert inventory level", KeyContext(key, initial_stock));

    // A zero opening balance needs no ledger row; replay from zero already matches.
    if (initial_stock > 0) {
      model::StockMovement movement;
      movement.id             = util::GenerateId();
      movement.spare_part_id  = key.spare_part_id;
      movement.store_id       = key.store_id;
      movement.movement_type  = MovementType::kIn;
      movement.quantity       = initial_stock;
      movement.previous_stock = 0;
      movement.new_stock      = initial_stock;
      movement.reference_type = model::reference::kInitialization;
      movement.reason         = "Initial stock";
      movement.created_by     = actor;
      movement.created_at_ms  = now_ms;
      db::ThrowIfDbError(repository_->AppendMovement(*tx, movement), "append stock movement", KeyContext(key, initial_stock));
    }

    db::CommitOrThrow(*tx, "initialize level " + key.ToString(), KeyContext(key, initial_stock));
    return level;
  });
}

MovementResult InventoryLedger::ReceiveStock(const LevelKey& key, Quantity quantity, model::Money unit_cost, const std::string& reference_id,
                                             const std::string& actor) {
  model::MovementReference reference;
  reference.reference_type = model::reference::kReceipt;
  reference.reference_id   = reference_id;
  reference.reason         = "Stock received";
  reference.created_by     = actor;
  reference.unit_cost      = unit_cost;
  return ApplyMovement(key, MovementType::kIn, quantity, reference);
}

std::optional<MovementResult> InventoryLedger::AdjustToCount(const LevelKey& key, Quantity physical_count, const std::string& reason,
                                                             const std::string& actor) {
  if (physical_count < 0) {
    throw util::InvalidArgument("physical count must not be negative", KeyContext(key, physical_count));
  }

  auto key_lock = LockKey(key);
  return util::WithRetry(retry_, [&]() -> std::optional<MovementResult> {
    auto tx    = repository_->Begin();
    auto level = repository_->GetLevel(*tx, key);
    if (!level) {
      throw util::NotFound("no inventory level for " + key.ToString(), KeyContext(key, physical_count));
    }

    const Quantity variance = physical_count - level->current_stock;
    if (variance == 0) {
      return std::nullopt;
    }

    MovementRequest request;
    request.key                      = key;
    request.type                     = MovementType::kAdjustment;
    request.quantity                 = variance;
    request.reference.reference_type = model::reference::kStockCount;
    request.reference.reason         = reason.empty() ? "Physical stock count" : reason;
    request.reference.created_by     = actor;

    auto result = ApplyMovementInTx(*tx, request);
    db::CommitOrThrow(*tx, "adjust level " + key.ToString(), KeyContext(key, physical_count));
    return result;
  });
}

std::vector<model::StockMovement> InventoryLedger::Transfer(const std::string& spare_part_id, const std::string& from_store_id,
                                                            const std::string& to_store_id, Quantity quantity, const std::string& actor) {
  const LevelKey from{spare_part_id, from_store_id};
  const LevelKey to{spare_part_id, to_store_id};
  if (quantity <= 0) {
    throw util::InvalidArgument("transfer quantity must be positive", KeyContext(from, quantity));
  }
  if (from == to) {
    throw util::InvalidArgument("transfer source and destination are the same store", KeyContext(from, quantity));
  }

  auto key_locks = LockKeys({from, to});
  return util::WithRetry(retry_, [&] {
    auto tx = repository_->Begin();

    // Destination levels are opened on first transfer.
    if (!repository_->GetLevel(*tx, to)) {
      model::InventoryLevel level;
      level.spare_part_id = to.spare_part_id;
      level.store_id      = to.store_id;
      db::ThrowIfDbError(repository_->InsertLevel(*tx, level), "insert inventory level", KeyContext(to, quantity));
    }

    const auto transfer_id = util::GenerateId();

    MovementRequest out;
    out.key                      = from;
    out.type                     = MovementType::kTransfer;
    out.quantity                 = -quantity;
    out.reference.reference_type = model::reference::kTransfer;
    out.reference.reference_id   = transfer_id;
    out.reference.reason         = "Transfer to " + to_store_id;
    out.reference.created_by     = actor;

    MovementRequest in  = out;
    in.key              = to;
    in.quantity         = quantity;
    in.reference.reason = "Transfer from " + from_store_id;

    std::vector<model::StockMovement> movements;
    movements.push_back(ApplyMovementInTx(*tx, out).movement);
    movements.push_back(ApplyMovementInTx(*tx, in).movement);
    db::CommitOrThrow(*tx, "transfer " + from.ToString() + " -> " + to.ToString(), KeyContext(from, quantity));
    return movements;
  });
}

Availability InventoryLedger::CheckAvailability(const LevelKey& key, Quantity quantity) {
  Availability availability;
  if (auto level = GetLevel(key)) {
    availability.available_stock = level->available_stock();
    availability.reserved_stock  = level->reserved_stock;
    availability.total_stock     = level->current_stock;
  }
  availability.available = quantity > 0 && availability.available_stock >= quantity;
  return availability;
}

std::vector<model::StockMovement> InventoryLedger::Movements(const LevelKey& key) {
  auto tx = repository_->Begin();
  return repository_->ListMovements(*tx, key);
}

Quantity InventoryLedger::Replay(const LevelKey& key) {
  Quantity stock = 0;
  for (const auto& movement : Movements(key)) {
    stock += movement.quantity;
  }
  return stock;
}

} // namespace outflow::inventory
