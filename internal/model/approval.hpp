#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace outflow::model {

enum class Decision : std::uint8_t {
  kPending = 1,
  kApproved = 2,
  kRejected = 3,
  kEscalated = 4,
};

// Audit row; never updated after insert.
struct ApprovalHistory {
  std::string id;
  std::string request_id;
  std::uint32_t level = 0;
  std::string approver_id;
  Decision decision = Decision::kPending;
  std::string comments;

  Money request_value = 0;
  Quantity available_stock = 0;

  std::uint64_t decided_at_ms = 0;
};

struct RoleAssignment {
  std::string principal_id;
  std::string role;
  std::uint32_t approval_level = 0;
  std::string granted_by;
  std::uint64_t granted_at_ms = 0;
};

constexpr const char* ToString(Decision decision) {
  switch (decision) {
    case Decision::kApproved:
      return "Approved";
    case Decision::kRejected:
      return "Rejected";
    case Decision::kEscalated:
      return "Escalated";
    default:
      return "Pending";
  }
}

} // namespace outflow::model
