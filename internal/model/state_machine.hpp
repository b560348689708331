#pragma once

#include <cstdint>

namespace outflow::model {

enum class RequestStatus : std::uint8_t {
  kUnspecified = 0,
  kPending = 1,
  kApproved = 2,
  kRejected = 3,
  kIssued = 4,
  kInstalled = 5,
  kReturned = 6,
};

constexpr bool IsTerminal(RequestStatus status) {
  return status == RequestStatus::kRejected || status == RequestStatus::kInstalled || status == RequestStatus::kReturned;
}

/*
  Pending  -> Approved | Rejected
  Approved -> Issued
  Issued   -> Installed | Returned

  Self-transitions are allowed for non-terminal states so that bookkeeping
  updates (notes, partial installs) can be written through the same path.
*/
constexpr bool CanTransition(RequestStatus from, RequestStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == to) {
    return from != RequestStatus::kUnspecified;
  }

  switch (from) {
    case RequestStatus::kUnspecified:
      return to == RequestStatus::kPending || to == RequestStatus::kApproved;
    case RequestStatus::kPending:
      return to == RequestStatus::kApproved || to == RequestStatus::kRejected;
    case RequestStatus::kApproved:
      return to == RequestStatus::kIssued;
    case RequestStatus::kIssued:
      return to == RequestStatus::kInstalled || to == RequestStatus::kReturned;
    default:
      return false;
  }
}

constexpr const char* ToString(RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:
      return "Pending";
    case RequestStatus::kApproved:
      return "Approved";
    case RequestStatus::kRejected:
      return "Rejected";
    case RequestStatus::kIssued:
      return "Issued";
    case RequestStatus::kInstalled:
      return "Installed";
    case RequestStatus::kReturned:
      return "Returned";
    default:
      return "Unspecified";
  }
}

} // namespace outflow::model
