#pragma once

#include <cstdint>
#include <string>
#include <tuple>

#include "internal/model/types.hpp"

namespace outflow::model {

struct LevelKey {
  std::string spare_part_id;
  std::string store_id;

  std::string ToString() const {
    return spare_part_id + "@" + store_id;
  }

  friend bool operator<(const LevelKey& a, const LevelKey& b) {
    return std::tie(a.spare_part_id, a.store_id) < std::tie(b.spare_part_id, b.store_id);
  }
  friend bool operator==(const LevelKey& a, const LevelKey& b) {
    return a.spare_part_id == b.spare_part_id && a.store_id == b.store_id;
  }
};

/*
  Stock counts for one (part, store) pair.

  INVARIANT: 0 <= reserved_stock <= current_stock.
  available_stock() is always derived; it is never persisted.
  version is bumped by every successful repository update and is the
  optimistic-concurrency fence for the row.
*/
struct InventoryLevel {
  std::string spare_part_id;
  std::string store_id;

  Quantity current_stock = 0;
  Quantity reserved_stock = 0;
  Quantity damaged_stock = 0;

  std::uint64_t version = 0;
  std::uint64_t last_movement_at_ms = 0;

  LevelKey Key() const {
    return {spare_part_id, store_id};
  }

  Quantity available_stock() const {
    return current_stock - reserved_stock;
  }
};

enum class MovementType : std::uint8_t {
  kUnspecified = 0,
  kIn = 1,
  kOut = 2,
  kTransfer = 3,
  kAdjustment = 4,
};

constexpr const char* ToString(MovementType type) {
  switch (type) {
    case MovementType::kIn:
      return "IN";
    case MovementType::kOut:
      return "OUT";
    case MovementType::kTransfer:
      return "TRANSFER";
    case MovementType::kAdjustment:
      return "ADJUSTMENT";
    default:
      return "UNSPECIFIED";
  }
}

// What caused a movement; stored with the ledger row for audit.
struct MovementReference {
  std::string reference_type;
  std::string reference_id;
  std::string reason;
  std::string created_by;
  Money unit_cost = 0;
};

/*
  Append-only ledger row.

  new_stock == previous_stock + quantity, and new_stock equals the level's
  current_stock at the moment the movement commits.
*/
struct StockMovement {
  std::string id;
  std::uint64_t sequence = 0;

  std::string spare_part_id;
  std::string store_id;

  MovementType movement_type = MovementType::kUnspecified;
  Quantity quantity = 0;
  Quantity previous_stock = 0;
  Quantity new_stock = 0;

  Money unit_cost = 0;
  std::string reference_type;
  std::string reference_id;
  std::string reason;
  std::string created_by;

  std::uint64_t created_at_ms = 0;
};

namespace reference {
inline constexpr const char* kService = "SERVICE";
inline constexpr const char* kReservation = "RESERVATION";
inline constexpr const char* kInitialization = "INITIALIZATION";
inline constexpr const char* kReceipt = "RECEIPT";
inline constexpr const char* kStockCount = "STOCK_COUNT";
inline constexpr const char* kTransfer = "TRANSFER";
inline constexpr const char* kReturn = "RETURN";
} // namespace reference

} // namespace outflow::model
