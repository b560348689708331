#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/approval/approval_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/limits/limit_evaluator.hpp"
#include "internal/model/installed_part.hpp"
#include "internal/model/part_request.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/retry.hpp"

namespace outflow::core {

struct CreateRequestInput {
  std::string     service_request_id;
  std::string     spare_part_id;
  std::string     technician_id;
  model::Quantity requested_quantity = 0;
  model::Urgency  urgency            = model::Urgency::kNormal;
  std::string     justification;
};

struct InstallInput {
  model::Quantity             quantity = 0;
  std::optional<model::Money> unit_cost;
  // Installer; empty means the technician who requested the part.
  std::string                 technician_id;
  std::string                 serial_number;
  std::string                 batch_number;
  std::string                 notes;
  std::string                 replaced_part_id;
};

struct ReturnInput {
  model::Quantity             quantity  = 0;
  model::ReturnCondition      condition = model::ReturnCondition::kGood;
  std::string                 reason;
  std::string                 technician_id;
  // Valuation of the returned units; defaults to the cost they were issued at.
  std::optional<model::Money> unit_cost;
};

struct ReturnLine {
  std::string request_id;
  ReturnInput input;
};

/*
  Drives a spare-part request from creation to installation or return.

  Every transition runs in one repository transaction together with the
  stock it moves, the approval entry it writes and the reservation it takes
  or gives back. Lock order is request mutex, then the level key mutex, then
  the transaction. Errors escaping a transition carry the request id.
*/
class RequestLifecycle {
 public:
  RequestLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<inventory::InventoryLedger> ledger,
                   std::shared_ptr<reservation::ReservationManager> reservations, std::shared_ptr<approval::ApprovalOrchestrator> approvals,
                   std::shared_ptr<limits::LimitEvaluator> limits, util::RetryPolicy retry);

  model::SparePartRequest Create(const CreateRequestInput& input, const util::CancellationToken* cancel = nullptr);
  model::SparePartRequest Approve(const std::string& request_id, const std::string& approver_id, const std::string& comments,
                                  const util::CancellationToken* cancel = nullptr);
  model::SparePartRequest Escalate(const std::string& request_id, const std::string& approver_id, std::uint32_t target_level,
                                   const std::string& comments);
  model::SparePartRequest Reject(const std::string& request_id, const std::string& approver_id, const std::string& reason);
  model::SparePartRequest Issue(const std::string& request_id);
  model::InstalledPart    Install(const std::string& request_id, const InstallInput& input);
  // Returns the credit movement, followed by the quarantine adjustment for damaged or defective parts.
  std::vector<model::StockMovement> Return(const std::string& request_id, const ReturnInput& input);
  // All lines commit together or not at all; movements come back in line order.
  std::vector<model::StockMovement> ReturnBatch(const std::vector<ReturnLine>& lines);

  model::SparePartRequest              Get(const std::string& request_id);
  std::vector<model::SparePartRequest> Find(const model::RequestFilter& filter);

  limits::PeriodUsage UsageFor(db::Transaction& tx, const std::string& technician_id, std::uint64_t now_ms);

 private:
  model::SparePartRequest Load(db::Transaction& tx, const std::string& request_id);
  void                    Save(db::Transaction& tx, model::SparePartRequest& request);
  model::Quantity         AvailableStock(db::Transaction& tx, const model::LevelKey& key);
  // Reserves for an approved request; a shortfall is recorded on the request instead of thrown.
  bool ReserveOrBlock(db::Transaction& tx, model::SparePartRequest& request);
  void ReturnInTx(db::Transaction& tx, const ReturnLine& line, std::vector<model::StockMovement>& movements);

  std::shared_ptr<db::Repository>                  repository_;
  std::shared_ptr<inventory::InventoryLedger>      ledger_;
  std::shared_ptr<reservation::ReservationManager> reservations_;
  std::shared_ptr<approval::ApprovalOrchestrator>  approvals_;
  std::shared_ptr<limits::LimitEvaluator>          limits_;
  util::RetryPolicy                                retry_;

  util::KeyedMutex request_locks_;
};

} // namespace outflow::core
