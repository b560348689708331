#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace outflow::model {

/*
  Spending ceiling for one technician.

  Scope is general when both category_id and spare_part_id are empty.
  A zero ceiling is unset.
*/
struct TechnicianLimit {
  std::string id;
  std::string technician_id;
  std::string category_id;
  std::string spare_part_id;

  Money max_value_per_request = 0;
  Quantity max_quantity_per_request = 0;
  Money max_value_per_day = 0;
  Money max_value_per_month = 0;
  Money auto_approve_below = 0;

  bool requires_approval = true;
  std::uint32_t approver_level = 1;
  bool active = true;
};

} // namespace outflow::model
