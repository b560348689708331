#pragma once

#include <memory>

namespace outflow::db { class Repository; }
namespace outflow::inventory { class InventoryLedger; }
namespace outflow::reservation { class ReservationManager; }
namespace outflow::approval { class ApprovalOrchestrator; }
namespace outflow::core { class RequestLifecycle; }
namespace outflow::cost { class CostCalculator; }

namespace outflow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<outflow::db::Repository> repository;
  std::shared_ptr<outflow::inventory::InventoryLedger> ledger;
  std::shared_ptr<outflow::reservation::ReservationManager> reservations;
  std::shared_ptr<outflow::approval::ApprovalOrchestrator> approvals;
  std::shared_ptr<outflow::core::RequestLifecycle> lifecycle;
  std::shared_ptr<outflow::cost::CostCalculator> cost;
};

} // namespace outflow::service
