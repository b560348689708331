#pragma once

#include "outflow/v1.hpp"
#include "service_context.hpp"

namespace outflow::service {

/*
  Collaborator seeding and stock administration: catalog rows, technician
  limits, approver roles and direct stock operations.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  void RegisterSparePart(const outflow::v1::RegisterSparePartRequest& req);
  void RegisterServiceRequest(const outflow::v1::RegisterServiceRequestRequest& req);

  outflow::v1::SetTechnicianLimitResponse
  SetTechnicianLimit(const outflow::v1::SetTechnicianLimitRequest& req);

  void GrantRole(const outflow::v1::GrantRoleRequest& req);
  void RevokeRole(const outflow::v1::RevokeRoleRequest& req);

  outflow::v1::StockLevelResponse
  InitializeStock(const outflow::v1::InitializeStockRequest& req);

  outflow::v1::StockLevelResponse
  ReceiveStock(const outflow::v1::ReceiveStockRequest& req);

  outflow::v1::StockLevelResponse
  AdjustStock(const outflow::v1::AdjustStockRequest& req);

  outflow::v1::ListStockMovementsResponse
  TransferStock(const outflow::v1::TransferStockRequest& req);

  outflow::v1::ListStockMovementsResponse
  ListStockMovements(const outflow::v1::ListStockMovementsRequest& req);

  outflow::v1::ReleaseExpiredReservationsResponse
  ReleaseExpiredReservations();

private:
  ServiceContext ctx_;
};

}
