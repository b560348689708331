#include "outward_flow_service.hpp"

#include <vector>

#include "internal/approval/approval_orchestrator.hpp"
#include "internal/core/request_lifecycle.hpp"
#include "internal/cost/cost_calculator.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace outflow::service {

using namespace outflow::v1;

OutwardFlowService::OutwardFlowService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string OutwardFlowService::ResolveIssuedRequest(const std::string& service_request_id, const std::string& spare_part_id) {
  model::RequestFilter filter;
  filter.service_request_id = service_request_id;
  filter.spare_part_id      = spare_part_id;
  filter.status             = model::RequestStatus::kIssued;

  for (const auto& request : ctx_.lifecycle->Find(filter)) {
    if (request.OutstandingQuantity() > 0) {
      return request.id;
    }
  }

  util::ErrorContext context;
  context.spare_part_id = spare_part_id;
  throw util::NotFound("no issued request for part " + spare_part_id + " on service request " + service_request_id, std::move(context));
}

PartRequestResponse OutwardFlowService::CreatePartRequest(const CreatePartRequestRequest& req) {
  return ObserveRpc("OutwardFlowService.CreatePartRequest", [&] {
    core::CreateRequestInput input;
    input.service_request_id = req.service_request_id();
    input.spare_part_id      = req.spare_part_id();
    input.technician_id      = req.technician_id();
    input.requested_quantity = req.requested_quantity();
    input.urgency            = FromProto(req.urgency());
    input.justification      = req.justification();

    PartRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.lifecycle->Create(input));
    return resp;
  });
}

CheckStockAvailabilityResponse OutwardFlowService::CheckStockAvailability(const CheckStockAvailabilityRequest& req) {
  return ObserveRpc("OutwardFlowService.CheckStockAvailability", [&] {
    const auto availability = ctx_.ledger->CheckAvailability({req.spare_part_id(), req.store_id()}, req.quantity());

    CheckStockAvailabilityResponse resp;
    resp.set_available(availability.available);
    resp.set_available_stock(availability.available_stock);
    resp.set_reserved_stock(availability.reserved_stock);
    resp.set_total_stock(availability.total_stock);
    return resp;
  });
}

PartRequestResponse OutwardFlowService::ApproveRequest(const ApproveRequestRequest& req) {
  return ObserveRpc("OutwardFlowService.ApproveRequest", [&] {
    PartRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.lifecycle->Approve(req.request_id(), req.approver_id(), req.comments()));
    return resp;
  });
}

PartRequestResponse OutwardFlowService::RejectRequest(const RejectRequestRequest& req) {
  return ObserveRpc("OutwardFlowService.RejectRequest", [&] {
    PartRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.lifecycle->Reject(req.request_id(), req.approver_id(), req.reason()));
    return resp;
  });
}

PartRequestResponse OutwardFlowService::EscalateRequest(const EscalateRequestRequest& req) {
  return ObserveRpc("OutwardFlowService.EscalateRequest", [&] {
    PartRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.lifecycle->Escalate(req.request_id(), req.approver_id(), req.target_level(), req.comments()));
    return resp;
  });
}

PartRequestResponse OutwardFlowService::IssueRequest(const IssueRequestRequest& req) {
  return ObserveRpc("OutwardFlowService.IssueRequest", [&] {
    PartRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.lifecycle->Issue(req.request_id()));
    return resp;
  });
}

InstallPartResponse OutwardFlowService::InstallPart(const InstallPartRequest& req) {
  return ObserveRpc("OutwardFlowService.InstallPart", [&] {
    const auto request_id = ResolveIssuedRequest(req.service_request_id(), req.spare_part_id());

    core::InstallInput input;
    input.quantity = req.quantity();
    if (req.unit_cost() > 0) {
      input.unit_cost = req.unit_cost();
    }
    input.technician_id    = req.technician_id();
    input.serial_number    = req.serial_number();
    input.batch_number     = req.batch_number();
    input.notes            = req.notes();
    input.replaced_part_id = req.replaced_part_id();

    InstallPartResponse resp;
    *resp.mutable_installed_part() = ToProto(ctx_.lifecycle->Install(request_id, input));
    return resp;
  });
}

// The whole batch commits in one transaction; a failing item leaves stock untouched.
ReturnPartsResponse OutwardFlowService::ReturnParts(const ReturnPartsRequest& req) {
  return ObserveRpc("OutwardFlowService.ReturnParts", [&] {
    std::vector<core::ReturnLine> lines;
    for (const auto& item : req.returns()) {
      core::ReturnLine line;
      line.request_id          = ResolveIssuedRequest(req.service_request_id(), item.spare_part_id());
      line.input.quantity      = item.quantity();
      line.input.condition     = FromProto(item.condition());
      line.input.reason        = item.reason();
      line.input.technician_id = item.technician_id();
      if (item.unit_cost() > 0) {
        line.input.unit_cost = item.unit_cost();
      }
      lines.push_back(std::move(line));
    }

    ReturnPartsResponse resp;
    for (const auto& movement : ctx_.lifecycle->ReturnBatch(lines)) {
      *resp.add_movements() = ToProto(movement);
    }
    return resp;
  });
}

CalculateServiceCostResponse OutwardFlowService::CalculateServiceCost(const CalculateServiceCostRequest& req) {
  return ObserveRpc("OutwardFlowService.CalculateServiceCost", [&] {
    CalculateServiceCostResponse resp;
    *resp.mutable_breakdown() = ToProto(ctx_.cost->Compute(req.service_request_id()));
    return resp;
  });
}

GetApprovalHistoryResponse OutwardFlowService::GetApprovalHistory(const GetApprovalHistoryRequest& req) {
  return ObserveRpc("OutwardFlowService.GetApprovalHistory", [&] {
    GetApprovalHistoryResponse resp;
    for (const auto& entry : ctx_.approvals->History(req.request_id())) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

PartRequestResponse OutwardFlowService::GetPartRequest(const GetPartRequestRequest& req) {
  return ObserveRpc("OutwardFlowService.GetPartRequest", [&] {
    PartRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.lifecycle->Get(req.request_id()));
    return resp;
  });
}

ListPartRequestsResponse OutwardFlowService::ListPartRequests(const ListPartRequestsRequest& req) {
  return ObserveRpc("OutwardFlowService.ListPartRequests", [&] {
    model::RequestFilter filter;
    if (!req.service_request_id().empty()) filter.service_request_id = req.service_request_id();
    if (!req.spare_part_id().empty()) filter.spare_part_id = req.spare_part_id();
    if (!req.technician_id().empty()) filter.technician_id = req.technician_id();
    if (req.status() != REQUEST_STATUS_UNSPECIFIED) filter.status = FromProto(req.status());

    ListPartRequestsResponse resp;
    for (const auto& request : ctx_.lifecycle->Find(filter)) {
      *resp.add_requests() = ToProto(request);
    }
    return resp;
  });
}

} // namespace outflow::service
