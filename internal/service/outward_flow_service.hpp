#pragma once

#include "outflow/v1.hpp"
#include "service_context.hpp"

namespace outflow::service {

/*
  Engine operations of the outward flow: request, approve, issue, install,
  return and settle. Each call is logged and rethrows engine errors
  unchanged.
*/
class OutwardFlowService {
public:
  explicit OutwardFlowService(ServiceContext ctx);

  outflow::v1::PartRequestResponse
  CreatePartRequest(const outflow::v1::CreatePartRequestRequest& req);

  outflow::v1::CheckStockAvailabilityResponse
  CheckStockAvailability(const outflow::v1::CheckStockAvailabilityRequest& req);

  outflow::v1::PartRequestResponse
  ApproveRequest(const outflow::v1::ApproveRequestRequest& req);

  outflow::v1::PartRequestResponse
  RejectRequest(const outflow::v1::RejectRequestRequest& req);

  outflow::v1::PartRequestResponse
  EscalateRequest(const outflow::v1::EscalateRequestRequest& req);

  outflow::v1::PartRequestResponse
  IssueRequest(const outflow::v1::IssueRequestRequest& req);

  outflow::v1::InstallPartResponse
  InstallPart(const outflow::v1::InstallPartRequest& req);

  outflow::v1::ReturnPartsResponse
  ReturnParts(const outflow::v1::ReturnPartsRequest& req);

  outflow::v1::CalculateServiceCostResponse
  CalculateServiceCost(const outflow::v1::CalculateServiceCostRequest& req);

  outflow::v1::GetApprovalHistoryResponse
  GetApprovalHistory(const outflow::v1::GetApprovalHistoryRequest& req);

  outflow::v1::PartRequestResponse
  GetPartRequest(const outflow::v1::GetPartRequestRequest& req);

  outflow::v1::ListPartRequestsResponse
  ListPartRequests(const outflow::v1::ListPartRequestsRequest& req);

private:
  // The Issued request of a service for one part with stock still outstanding.
  std::string ResolveIssuedRequest(const std::string& service_request_id, const std::string& spare_part_id);

  ServiceContext ctx_;
};

}
