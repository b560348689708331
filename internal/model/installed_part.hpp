#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace outflow::model {

enum class ReturnCondition : std::uint8_t {
  kGood = 1,
  kDamaged = 2,
  kDefective = 3,
};

// Immutable once written.
struct InstalledPart {
  std::string id;
  std::string request_id;
  std::string service_request_id;
  std::string spare_part_id;
  std::string technician_id;
  std::string store_id;

  Quantity quantity = 0;
  Money unit_cost = 0;
  Money total_cost = 0;
  Money selling_price = 0;
  Money total_revenue = 0;

  std::string serial_number;
  std::string batch_number;
  std::string notes;
  std::string replaced_part_id;

  std::uint32_t warranty_months = 0;
  std::uint64_t warranty_expires_at_ms = 0;
  std::uint64_t installed_at_ms = 0;
};

constexpr const char* ToString(ReturnCondition condition) {
  switch (condition) {
    case ReturnCondition::kDamaged:
      return "Damaged";
    case ReturnCondition::kDefective:
      return "Defective";
    default:
      return "Good";
  }
}

} // namespace outflow::model
