#pragma once

#include "internal/model/approval.hpp"
#include "internal/model/cost_breakdown.hpp"
#include "internal/model/installed_part.hpp"
#include "internal/model/inventory.hpp"
#include "internal/model/part_request.hpp"
#include "outflow/v1.hpp"

namespace outflow::service {

/*
  Conversions between engine models and the outflow.v1 wire messages.
*/

outflow::v1::PartRequest   ToProto(const model::SparePartRequest& request);
outflow::v1::StockLevel    ToProto(const model::InventoryLevel& level);
outflow::v1::StockMovement ToProto(const model::StockMovement& movement);
outflow::v1::ApprovalEntry ToProto(const model::ApprovalHistory& entry);
outflow::v1::InstalledPart ToProto(const model::InstalledPart& part);
outflow::v1::CostBreakdown ToProto(const model::ServiceCostBreakdown& breakdown);

outflow::v1::RequestStatus   ToProto(model::RequestStatus status);
outflow::v1::Urgency         ToProto(model::Urgency urgency);
outflow::v1::MovementType    ToProto(model::MovementType type);
outflow::v1::Decision        ToProto(model::Decision decision);

model::RequestStatus   FromProto(outflow::v1::RequestStatus status);
model::Urgency         FromProto(outflow::v1::Urgency urgency);
// Throws util::InvalidArgument for RETURN_CONDITION_UNSPECIFIED.
model::ReturnCondition FromProto(outflow::v1::ReturnCondition condition);

} // namespace outflow::service
