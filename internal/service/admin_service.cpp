#include "admin_service.hpp"

#include "internal/approval/approval_orchestrator.hpp"
#include "internal/db/api/errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace outflow::service {

using namespace outflow::v1;

namespace {

void RequireField(const std::string& value, const char* name) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(name) + " is required");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AdminService::RegisterSparePart(const RegisterSparePartRequest& req) {
  ObserveRpc("AdminService.RegisterSparePart", [&] {
    RequireField(req.id(), "id");
    if (req.unit_cost() < 0 || req.selling_price() < 0) {
      throw util::InvalidArgument("prices must not be negative");
    }

    model::SparePart part;
    part.id              = req.id();
    part.name            = req.name();
    part.category_id     = req.category_id();
    part.unit_cost       = req.unit_cost();
    part.selling_price   = req.selling_price();
    part.minimum_stock   = req.minimum_stock();
    part.reorder_level   = req.reorder_level();
    part.warranty_months = req.warranty_months();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpsertSparePart(*tx, part), "register spare part");
    db::CommitOrThrow(*tx, "register spare part");
  });
}

void AdminService::RegisterServiceRequest(const RegisterServiceRequestRequest& req) {
  ObserveRpc("AdminService.RegisterServiceRequest", [&] {
    RequireField(req.id(), "id");
    RequireField(req.store_id(), "store_id");
    if (req.labor_hours() < 0) {
      throw util::InvalidArgument("labor hours must not be negative");
    }

    model::ServiceRequest service;
    service.id            = req.id();
    service.store_id      = req.store_id();
    service.technician_id = req.technician_id();
    service.labor_hours   = req.labor_hours();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpsertServiceRequest(*tx, service), "register service request");
    db::CommitOrThrow(*tx, "register service request");
  });
}

SetTechnicianLimitResponse AdminService::SetTechnicianLimit(const SetTechnicianLimitRequest& req) {
  return ObserveRpc("AdminService.SetTechnicianLimit", [&] {
    RequireField(req.technician_id(), "technician_id");

    model::TechnicianLimit limit;
    limit.id                       = req.id().empty() ? util::GenerateId() : req.id();
    limit.technician_id            = req.technician_id();
    limit.category_id              = req.category_id();
    limit.spare_part_id            = req.spare_part_id();
    limit.max_value_per_request    = req.max_value_per_request();
    limit.max_quantity_per_request = req.max_quantity_per_request();
    limit.max_value_per_day        = req.max_value_per_day();
    limit.max_value_per_month      = req.max_value_per_month();
    limit.auto_approve_below       = req.auto_approve_below();
    limit.requires_approval        = req.requires_approval();
    limit.approver_level           = req.approver_level() == 0 ? 1 : req.approver_level();
    limit.active                   = req.active();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpsertLimit(*tx, limit), "set technician limit");
    db::CommitOrThrow(*tx, "set technician limit");

    SetTechnicianLimitResponse resp;
    resp.set_id(limit.id);
    return resp;
  });
}

void AdminService::GrantRole(const GrantRoleRequest& req) {
  ObserveRpc("AdminService.GrantRole",
             [&] { ctx_.approvals->GrantRole(req.principal_id(), req.role(), req.approval_level(), req.granted_by()); });
}

void AdminService::RevokeRole(const RevokeRoleRequest& req) {
  ObserveRpc("AdminService.RevokeRole", [&] { ctx_.approvals->RevokeRole(req.principal_id(), req.role()); });
}

StockLevelResponse AdminService::InitializeStock(const InitializeStockRequest& req) {
  return ObserveRpc("AdminService.InitializeStock", [&] {
    RequireField(req.spare_part_id(), "spare_part_id");
    RequireField(req.store_id(), "store_id");

    StockLevelResponse resp;
    *resp.mutable_level() = ToProto(ctx_.ledger->InitializeLevel({req.spare_part_id(), req.store_id()}, req.initial_stock(), req.actor()));
    return resp;
  });
}

StockLevelResponse AdminService::ReceiveStock(const ReceiveStockRequest& req) {
  return ObserveRpc("AdminService.ReceiveStock", [&] {
    auto result = ctx_.ledger->ReceiveStock({req.spare_part_id(), req.store_id()}, req.quantity(), req.unit_cost(), req.reference_id(), req.actor());

    StockLevelResponse resp;
    *resp.mutable_level() = ToProto(result.level);
    return resp;
  });
}

StockLevelResponse AdminService::AdjustStock(const AdjustStockRequest& req) {
  return ObserveRpc("AdminService.AdjustStock", [&] {
    const model::LevelKey key{req.spare_part_id(), req.store_id()};
    auto                  result = ctx_.ledger->AdjustToCount(key, req.physical_count(), req.reason(), req.actor());

    StockLevelResponse resp;
    if (result) {
      *resp.mutable_level() = ToProto(result->level);
      return resp;
    }
    auto level = ctx_.ledger->GetLevel(key);
    if (!level) {
      throw util::NotFound("no inventory level for " + key.ToString());
    }
    *resp.mutable_level() = ToProto(*level);
    return resp;
  });
}

ListStockMovementsResponse AdminService::TransferStock(const TransferStockRequest& req) {
  return ObserveRpc("AdminService.TransferStock", [&] {
    ListStockMovementsResponse resp;
    for (const auto& movement :
         ctx_.ledger->Transfer(req.spare_part_id(), req.from_store_id(), req.to_store_id(), req.quantity(), req.actor())) {
      *resp.add_movements() = ToProto(movement);
    }
    return resp;
  });
}

ListStockMovementsResponse AdminService::ListStockMovements(const ListStockMovementsRequest& req) {
  return ObserveRpc("AdminService.ListStockMovements", [&] {
    ListStockMovementsResponse resp;
    for (const auto& movement : ctx_.ledger->Movements({req.spare_part_id(), req.store_id()})) {
      *resp.add_movements() = ToProto(movement);
    }
    return resp;
  });
}

ReleaseExpiredReservationsResponse AdminService::ReleaseExpiredReservations() {
  return ObserveRpc("AdminService.ReleaseExpiredReservations", [&] {
    ReleaseExpiredReservationsResponse resp;
    resp.set_released(ctx_.reservations->ReleaseExpired(util::NowMs()));
    return resp;
  });
}

} // namespace outflow::service
