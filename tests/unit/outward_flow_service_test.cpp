#include "internal/service/outward_flow_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace outflow::v1;
using outflow::service::OutwardFlowService;

outflow::factory::Application MakeApp() {
  outflow::runtime::config::RuntimeConfig config;
  config.mutable_retry()->set_max_attempts(50);
  return outflow::factory::Build(config, std::make_shared<outflow::db::memory::MemoryRepository>());
}

void Seed(outflow::factory::Application& app) {
  RegisterSparePartRequest part;
  part.set_id("part-filter");
  part.set_name("Oil filter");
  part.set_category_id("cat-filters");
  part.set_unit_cost(5000);
  part.set_selling_price(7500);
  part.set_reorder_level(2);
  app.admin_service->RegisterSparePart(part);

  RegisterServiceRequestRequest service;
  service.set_id("svc-1");
  service.set_store_id("store-1");
  service.set_technician_id("tech-1");
  service.set_labor_hours(1.5);
  app.admin_service->RegisterServiceRequest(service);

  InitializeStockRequest init;
  init.set_spare_part_id("part-filter");
  init.set_store_id("store-1");
  init.set_initial_stock(10);
  init.set_actor("admin");
  auto level = app.admin_service->InitializeStock(init);
  assert(level.level().current_stock() == 10);

  SetTechnicianLimitRequest limit;
  limit.set_technician_id("tech-1");
  limit.set_auto_approve_below(20000);
  limit.set_requires_approval(true);
  limit.set_active(true);
  auto limit_id = app.admin_service->SetTechnicianLimit(limit);
  assert(!limit_id.id().empty());

  GrantRoleRequest grant;
  grant.set_principal_id("mgr-1");
  grant.set_role("store_manager");
  grant.set_approval_level(1);
  grant.set_granted_by("admin");
  app.admin_service->GrantRole(grant);
}

CreatePartRequestRequest Create(std::int64_t quantity) {
  CreatePartRequestRequest req;
  req.set_service_request_id("svc-1");
  req.set_spare_part_id("part-filter");
  req.set_technician_id("tech-1");
  req.set_requested_quantity(quantity);
  req.set_urgency(URGENCY_URGENT);
  req.set_justification("leaking filter");
  return req;
}

PartRequest Issue(OutwardFlowService& flow, const std::string& request_id) {
  IssueRequestRequest req;
  req.set_request_id(request_id);
  return flow.IssueRequest(req).request();
}

void TestServiceFlowFromRequestToSettlement() {
  auto app = MakeApp();
  Seed(app);
  auto& flow = *app.outward_flow_service;

  // Auto-approved: 2 x 75.00 is below 200.00.
  auto first = flow.CreatePartRequest(Create(2)).request();
  assert(first.status() == REQUEST_STATUS_APPROVED);
  assert(first.urgency() == URGENCY_URGENT);
  assert(first.estimated_cost() == 15000);
  assert(Issue(flow, first.id()).status() == REQUEST_STATUS_ISSUED);

  InstallPartRequest install;
  install.set_service_request_id("svc-1");
  install.set_spare_part_id("part-filter");
  install.set_technician_id("tech-1");
  install.set_quantity(2);
  install.set_serial_number("SN-42");
  auto installed = flow.InstallPart(install).installed_part();
  assert(installed.request_id() == first.id());
  assert(installed.unit_cost() == 5000);
  assert(installed.total_revenue() == 15000);
  assert(installed.serial_number() == "SN-42");
  assert(installed.technician_id() == "tech-1");

  CalculateServiceCostRequest cost;
  cost.set_service_request_id("svc-1");
  auto breakdown = flow.CalculateServiceCost(cost).breakdown();
  assert(breakdown.version() == 1);
  assert(breakdown.parts_cost() == 10000);
  assert(breakdown.labor_cost() == 75000);
  assert(breakdown.grand_total() == 133930);
  assert(breakdown.margin_percent() == 17.62);
  assert(breakdown.lines_size() == 1);

  // 3 x 75.00 needs a store manager.
  auto second = flow.CreatePartRequest(Create(3)).request();
  assert(second.status() == REQUEST_STATUS_PENDING);
  assert(second.approval_level() == 1);

  ApproveRequestRequest approve;
  approve.set_request_id(second.id());
  approve.set_approver_id("mgr-1");
  approve.set_comments("go ahead");
  assert(flow.ApproveRequest(approve).request().status() == REQUEST_STATUS_APPROVED);
  Issue(flow, second.id());

  ReturnPartsRequest returns;
  returns.set_service_request_id("svc-1");
  auto* good = returns.add_returns();
  good->set_spare_part_id("part-filter");
  good->set_quantity(1);
  good->set_condition(RETURN_CONDITION_GOOD);
  good->set_reason("not used");
  auto* broken = returns.add_returns();
  broken->set_spare_part_id("part-filter");
  broken->set_quantity(2);
  broken->set_condition(RETURN_CONDITION_DAMAGED);
  broken->set_reason("dropped");
  auto returned = flow.ReturnParts(returns);
  assert(returned.movements_size() == 3);
  assert(returned.movements(0).movement_type() == MOVEMENT_TYPE_IN);
  assert(returned.movements(2).movement_type() == MOVEMENT_TYPE_ADJUSTMENT);

  GetPartRequestRequest get;
  get.set_request_id(second.id());
  assert(flow.GetPartRequest(get).request().status() == REQUEST_STATUS_RETURNED);

  // Nothing from the second request reached the customer, so the settlement is unchanged.
  auto again = flow.CalculateServiceCost(cost).breakdown();
  assert(again.version() == 1);
  assert(again.id() == breakdown.id());

  CheckStockAvailabilityRequest check;
  check.set_spare_part_id("part-filter");
  check.set_store_id("store-1");
  check.set_quantity(6);
  auto availability = flow.CheckStockAvailability(check);
  assert(availability.available());
  assert(availability.available_stock() == 6);
  assert(availability.total_stock() == 6);

  GetApprovalHistoryRequest history;
  history.set_request_id(second.id());
  auto entries = flow.GetApprovalHistory(history);
  assert(entries.entries_size() == 2);
  assert(entries.entries(0).decision() == DECISION_PENDING);
  assert(entries.entries(1).decision() == DECISION_APPROVED);
  assert(entries.entries(1).approver_id() == "mgr-1");

  ListPartRequestsRequest list;
  list.set_service_request_id("svc-1");
  assert(flow.ListPartRequests(list).requests_size() == 2);
  list.set_status(REQUEST_STATUS_INSTALLED);
  assert(flow.ListPartRequests(list).requests_size() == 1);
}

void TestInstallNeedsIssuedRequest() {
  auto app = MakeApp();
  Seed(app);

  InstallPartRequest install;
  install.set_service_request_id("svc-1");
  install.set_spare_part_id("part-filter");
  install.set_quantity(1);

  bool threw = false;
  try {
    app.outward_flow_service->InstallPart(install);
  } catch (const outflow::util::NotFound& e) {
    threw = true;
    assert(e.Context().spare_part_id == "part-filter");
  }
  assert(threw);
}

void TestRejectAndEscalateThroughService() {
  auto app = MakeApp();
  Seed(app);
  auto& flow = *app.outward_flow_service;

  auto request = flow.CreatePartRequest(Create(3)).request();

  EscalateRequestRequest escalate;
  escalate.set_request_id(request.id());
  escalate.set_approver_id("mgr-1");
  escalate.set_target_level(2);
  escalate.set_comments("above my limit");
  assert(flow.EscalateRequest(escalate).request().approval_level() == 2);

  RejectRequestRequest reject;
  reject.set_request_id(request.id());
  reject.set_approver_id("mgr-1");
  reject.set_reason("duplicate");
  bool outranked = false;
  try {
    flow.RejectRequest(reject);
  } catch (const outflow::util::LimitExceeded&) {
    outranked = true;
  }
  assert(outranked);

  GrantRoleRequest grant;
  grant.set_principal_id("mgr-2");
  grant.set_role("regional_manager");
  grant.set_approval_level(2);
  grant.set_granted_by("admin");
  app.admin_service->GrantRole(grant);

  reject.set_approver_id("mgr-2");
  auto rejected = flow.RejectRequest(reject).request();
  assert(rejected.status() == REQUEST_STATUS_REJECTED);
  assert(rejected.note() == "duplicate");
}

void RegisterSecondPart(outflow::factory::Application& app) {
  RegisterSparePartRequest part;
  part.set_id("part-belt");
  part.set_name("Drive belt");
  part.set_category_id("cat-belts");
  part.set_unit_cost(2000);
  part.set_selling_price(3000);
  app.admin_service->RegisterSparePart(part);

  InitializeStockRequest init;
  init.set_spare_part_id("part-belt");
  init.set_store_id("store-1");
  init.set_initial_stock(5);
  init.set_actor("admin");
  app.admin_service->InitializeStock(init);
}

CheckStockAvailabilityResponse Stock(OutwardFlowService& flow, const std::string& part_id) {
  CheckStockAvailabilityRequest check;
  check.set_spare_part_id(part_id);
  check.set_store_id("store-1");
  check.set_quantity(1);
  return flow.CheckStockAvailability(check);
}

void TestReturnBatchAcrossParts() {
  auto app = MakeApp();
  Seed(app);
  RegisterSecondPart(app);
  auto& flow = *app.outward_flow_service;

  auto filter = flow.CreatePartRequest(Create(2)).request();
  Issue(flow, filter.id());
  auto belt_req = Create(2);
  belt_req.set_spare_part_id("part-belt");
  auto belt = flow.CreatePartRequest(belt_req).request();
  assert(belt.status() == REQUEST_STATUS_APPROVED);
  Issue(flow, belt.id());
  assert(Stock(flow, "part-filter").total_stock() == 8);
  assert(Stock(flow, "part-belt").total_stock() == 3);

  ReturnPartsRequest returns;
  returns.set_service_request_id("svc-1");
  auto* filter_item = returns.add_returns();
  filter_item->set_spare_part_id("part-filter");
  filter_item->set_quantity(1);
  filter_item->set_condition(RETURN_CONDITION_GOOD);
  filter_item->set_technician_id("tech-2");
  auto* belt_item = returns.add_returns();
  belt_item->set_spare_part_id("part-belt");
  belt_item->set_quantity(2);
  belt_item->set_condition(RETURN_CONDITION_GOOD);
  belt_item->set_unit_cost(1800);

  auto returned = flow.ReturnParts(returns);
  assert(returned.movements_size() == 2);
  assert(returned.movements(0).spare_part_id() == "part-filter");
  assert(returned.movements(0).created_by() == "tech-2");
  assert(returned.movements(0).unit_cost() == 5000);
  assert(returned.movements(1).spare_part_id() == "part-belt");
  assert(returned.movements(1).unit_cost() == 1800);
  assert(Stock(flow, "part-filter").total_stock() == 9);
  assert(Stock(flow, "part-belt").total_stock() == 5);

  GetPartRequestRequest get;
  get.set_request_id(belt.id());
  assert(flow.GetPartRequest(get).request().status() == REQUEST_STATUS_RETURNED);
  get.set_request_id(filter.id());
  assert(flow.GetPartRequest(get).request().returned_quantity() == 1);
}

void TestFailingReturnItemLeavesBatchUnapplied() {
  auto app = MakeApp();
  Seed(app);
  RegisterSecondPart(app);
  auto& flow = *app.outward_flow_service;

  auto filter = flow.CreatePartRequest(Create(2)).request();
  Issue(flow, filter.id());
  auto belt_req = Create(1);
  belt_req.set_spare_part_id("part-belt");
  auto belt = flow.CreatePartRequest(belt_req).request();
  Issue(flow, belt.id());

  // The second item has no issued request to return against.
  ReturnPartsRequest unknown;
  unknown.set_service_request_id("svc-1");
  auto* good = unknown.add_returns();
  good->set_spare_part_id("part-filter");
  good->set_quantity(1);
  good->set_condition(RETURN_CONDITION_GOOD);
  unknown.add_returns()->set_spare_part_id("part-unknown");
  unknown.mutable_returns(1)->set_quantity(1);

  bool threw = false;
  try {
    flow.ReturnParts(unknown);
  } catch (const outflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(Stock(flow, "part-filter").total_stock() == 8);

  // The second item returns more than was issued; the first must roll back with it.
  ReturnPartsRequest too_many;
  too_many.set_service_request_id("svc-1");
  *too_many.add_returns() = unknown.returns(0);
  auto* belt_item         = too_many.add_returns();
  belt_item->set_spare_part_id("part-belt");
  belt_item->set_quantity(3);
  belt_item->set_condition(RETURN_CONDITION_DAMAGED);

  threw = false;
  try {
    flow.ReturnParts(too_many);
  } catch (const outflow::util::InvalidArgument& e) {
    threw = true;
    assert(e.Context().request_id == belt.id());
  }
  assert(threw);
  assert(Stock(flow, "part-filter").total_stock() == 8);
  assert(Stock(flow, "part-belt").total_stock() == 4);

  GetPartRequestRequest get;
  get.set_request_id(filter.id());
  auto unchanged = flow.GetPartRequest(get).request();
  assert(unchanged.returned_quantity() == 0);
  assert(unchanged.status() == REQUEST_STATUS_ISSUED);

  ListStockMovementsRequest movements;
  movements.set_spare_part_id("part-filter");
  movements.set_store_id("store-1");
  assert(app.admin_service->ListStockMovements(movements).movements_size() == 2);
}

void TestStockAdministration() {
  auto app = MakeApp();
  Seed(app);
  auto& admin = *app.admin_service;

  TransferStockRequest transfer;
  transfer.set_spare_part_id("part-filter");
  transfer.set_from_store_id("store-1");
  transfer.set_to_store_id("store-2");
  transfer.set_quantity(4);
  transfer.set_actor("admin");
  auto moved = admin.TransferStock(transfer);
  assert(moved.movements_size() == 2);
  assert(moved.movements(0).movement_type() == MOVEMENT_TYPE_TRANSFER);

  AdjustStockRequest adjust;
  adjust.set_spare_part_id("part-filter");
  adjust.set_store_id("store-2");
  adjust.set_physical_count(3);
  adjust.set_reason("cycle count");
  adjust.set_actor("auditor");
  assert(admin.AdjustStock(adjust).level().current_stock() == 3);
  // Matching count leaves the level as it is.
  assert(admin.AdjustStock(adjust).level().current_stock() == 3);

  ReceiveStockRequest receive;
  receive.set_spare_part_id("part-filter");
  receive.set_store_id("store-2");
  receive.set_quantity(5);
  receive.set_unit_cost(4800);
  receive.set_reference_id("po-7");
  receive.set_actor("admin");
  assert(admin.ReceiveStock(receive).level().current_stock() == 8);

  ListStockMovementsRequest movements;
  movements.set_spare_part_id("part-filter");
  movements.set_store_id("store-2");
  auto listed = admin.ListStockMovements(movements);
  assert(listed.movements_size() == 3);
  assert(listed.movements(2).unit_cost() == 4800);

  assert(admin.ReleaseExpiredReservations().released() == 0);

  RevokeRoleRequest revoke;
  revoke.set_principal_id("mgr-1");
  revoke.set_role("super_admin");
  bool threw = false;
  try {
    admin.RevokeRole(revoke);
  } catch (const outflow::util::ProtectedRoleViolation&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestServiceFlowFromRequestToSettlement();
  TestInstallNeedsIssuedRequest();
  TestRejectAndEscalateThroughService();
  TestReturnBatchAcrossParts();
  TestFailingReturnItemLeavesBatchUnapplied();
  TestStockAdministration();

  std::cout << "outflow_unit_outward_flow_service: pass\n";
  return 0;
}
