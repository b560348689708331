#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace outflow::model {

/*
  Catalog rows the engine consults but does not own.

  Pricing is read at request time and snapshotted onto the request; later
  price changes never reach an in-flight request.
*/

struct SparePart {
  std::string id;
  std::string name;
  std::string category_id;

  Money unit_cost = 0;
  Money selling_price = 0;

  Quantity minimum_stock = 0;
  Quantity reorder_level = 0;

  std::uint32_t warranty_months = 0;
};

struct ServiceRequest {
  std::string id;
  std::string store_id;
  std::string technician_id;
  double labor_hours = 0.0;
};

} // namespace outflow::model
