#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/types.hpp"

namespace outflow::model {

struct CostLine {
  std::string spare_part_id;
  Quantity quantity = 0;
  Money unit_cost = 0;
  Money total_cost = 0;
  Money selling_price = 0;
  Money total_revenue = 0;
};

/*
  Settlement for one service request.

  Rows are immutable and versioned per service; a recalculation with changed
  inputs inserts version + 1.
*/
struct ServiceCostBreakdown {
  std::string id;
  std::string service_request_id;
  std::uint32_t version = 0;

  Money parts_cost = 0;
  Money parts_revenue = 0;
  Money parts_markup = 0;

  double labor_hours = 0.0;
  Money labor_rate_per_hour = 0;
  Money labor_cost = 0;
  Money labor_markup = 0;
  Money labor_total = 0;

  double labor_markup_percent = 0.0;
  double overhead_percent = 0.0;
  Money overhead_cost = 0;
  Money subtotal = 0;
  double tax_percent = 0.0;
  Money tax_amount = 0;
  Money grand_total = 0;

  Money total_revenue = 0;
  Money total_cost = 0;
  Money net_margin = 0;
  double margin_percent = 0.0;

  std::vector<CostLine> lines;

  std::uint64_t calculated_at_ms = 0;
};

} // namespace outflow::model
