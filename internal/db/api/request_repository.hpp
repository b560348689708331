#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/part_request.hpp"
#include "internal/model/reservation.hpp"

namespace outflow::db {

class RequestRepository {
 public:
  virtual ~RequestRepository() = default;

  virtual Result InsertRequest(Transaction&, const model::SparePartRequest&) = 0;

  virtual std::optional<model::SparePartRequest> GetRequest(Transaction&, const std::string& id) = 0;

  // Writes only when the stored version equals request.version; bumps request.version on success.
  virtual Result UpdateRequest(Transaction&, model::SparePartRequest& request) = 0;

  // Ordered by creation time, oldest first.
  virtual std::vector<model::SparePartRequest> FindRequests(Transaction&, const model::RequestFilter&) = 0;
};

class ReservationRepository {
 public:
  virtual ~ReservationRepository() = default;

  virtual Result InsertReservation(Transaction&, const model::StockReservation&) = 0;

  virtual std::optional<model::StockReservation> GetReservation(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::StockReservation> GetActiveReservation(Transaction&, const std::string& request_id) = 0;

  virtual Result UpdateReservation(Transaction&, const model::StockReservation&) = 0;

  virtual std::vector<model::StockReservation> ListActiveReservations(Transaction&) = 0;
};

} // namespace outflow::db
