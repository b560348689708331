#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/model/types.hpp"

namespace outflow::model {

enum class Urgency : std::uint8_t {
  kNormal = 1,
  kUrgent = 2,
  kEmergency = 3,
};

/*
  One technician request for one part against one service request.

  Mutated only through RequestLifecycle transitions. issued_quantity is
  accounted for by installed_quantity + returned_quantity; the request is
  terminal once the two add up to it.
*/
struct SparePartRequest {
  std::string id;
  std::string service_request_id;
  std::string spare_part_id;
  std::string store_id;
  std::string technician_id;

  Quantity requested_quantity = 0;
  Urgency urgency = Urgency::kNormal;
  std::string justification;

  RequestStatus status = RequestStatus::kUnspecified;
  std::uint32_t approval_level = 0;
  std::uint32_t achieved_level = 0;

  Money estimated_cost = 0;

  Quantity issued_quantity = 0;
  Money issue_unit_cost = 0;
  Money issued_cost = 0;
  Quantity installed_quantity = 0;
  Quantity returned_quantity = 0;

  bool stock_blocked = false;
  std::string note;

  std::string approved_by;
  std::uint64_t approved_at_ms = 0;
  std::uint64_t issued_at_ms = 0;
  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;

  std::uint64_t version = 0;

  Quantity OutstandingQuantity() const {
    return issued_quantity - installed_quantity - returned_quantity;
  }
};

struct RequestFilter {
  std::optional<std::string> service_request_id;
  std::optional<std::string> spare_part_id;
  std::optional<std::string> technician_id;
  std::optional<RequestStatus> status;
  std::optional<std::uint64_t> created_since_ms;
};

constexpr const char* ToString(Urgency urgency) {
  switch (urgency) {
    case Urgency::kUrgent:
      return "Urgent";
    case Urgency::kEmergency:
      return "Emergency";
    default:
      return "Normal";
  }
}

} // namespace outflow::model
