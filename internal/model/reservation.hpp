#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace outflow::model {

enum class ReservationStatus : std::uint8_t {
  kActive = 1,
  kConsumed = 2,
  kReleased = 3,
  kExpired = 4,
};

/*
  Hold on available stock for one request.

  At most one Active reservation per request. Only Active reservations count
  toward the level's reserved_stock.
*/
struct StockReservation {
  std::string id;
  std::string request_id;
  std::string spare_part_id;
  std::string store_id;

  Quantity reserved_quantity = 0;
  std::string reserved_for;

  ReservationStatus status = ReservationStatus::kActive;
  std::string release_reason;

  std::uint64_t reserved_at_ms = 0;
  std::uint64_t expires_at_ms = 0;
  std::uint64_t updated_at_ms = 0;

  bool IsExpired(std::uint64_t now_ms) const {
    return expires_at_ms <= now_ms;
  }
};

constexpr const char* ToString(ReservationStatus status) {
  switch (status) {
    case ReservationStatus::kActive:
      return "Active";
    case ReservationStatus::kConsumed:
      return "Consumed";
    case ReservationStatus::kReleased:
      return "Released";
    default:
      return "Expired";
  }
}

} // namespace outflow::model
