#include "proto_convert.hpp"

#include "internal/util/errors.hpp"

namespace outflow::service {

using namespace outflow::v1;

outflow::v1::RequestStatus ToProto(model::RequestStatus status) {
  switch (status) {
    case model::RequestStatus::kPending:
      return REQUEST_STATUS_PENDING;
    case model::RequestStatus::kApproved:
      return REQUEST_STATUS_APPROVED;
    case model::RequestStatus::kRejected:
      return REQUEST_STATUS_REJECTED;
    case model::RequestStatus::kIssued:
      return REQUEST_STATUS_ISSUED;
    case model::RequestStatus::kInstalled:
      return REQUEST_STATUS_INSTALLED;
    case model::RequestStatus::kReturned:
      return REQUEST_STATUS_RETURNED;
    default:
      return REQUEST_STATUS_UNSPECIFIED;
  }
}

outflow::v1::Urgency ToProto(model::Urgency urgency) {
  switch (urgency) {
    case model::Urgency::kUrgent:
      return URGENCY_URGENT;
    case model::Urgency::kEmergency:
      return URGENCY_EMERGENCY;
    default:
      return URGENCY_NORMAL;
  }
}

outflow::v1::MovementType ToProto(model::MovementType type) {
  switch (type) {
    case model::MovementType::kIn:
      return MOVEMENT_TYPE_IN;
    case model::MovementType::kOut:
      return MOVEMENT_TYPE_OUT;
    case model::MovementType::kTransfer:
      return MOVEMENT_TYPE_TRANSFER;
    case model::MovementType::kAdjustment:
      return MOVEMENT_TYPE_ADJUSTMENT;
    default:
      return MOVEMENT_TYPE_UNSPECIFIED;
  }
}

outflow::v1::Decision ToProto(model::Decision decision) {
  switch (decision) {
    case model::Decision::kPending:
      return DECISION_PENDING;
    case model::Decision::kApproved:
      return DECISION_APPROVED;
    case model::Decision::kRejected:
      return DECISION_REJECTED;
    case model::Decision::kEscalated:
      return DECISION_ESCALATED;
    default:
      return DECISION_UNSPECIFIED;
  }
}

model::RequestStatus FromProto(outflow::v1::RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_PENDING:
      return model::RequestStatus::kPending;
    case REQUEST_STATUS_APPROVED:
      return model::RequestStatus::kApproved;
    case REQUEST_STATUS_REJECTED:
      return model::RequestStatus::kRejected;
    case REQUEST_STATUS_ISSUED:
      return model::RequestStatus::kIssued;
    case REQUEST_STATUS_INSTALLED:
      return model::RequestStatus::kInstalled;
    case REQUEST_STATUS_RETURNED:
      return model::RequestStatus::kReturned;
    default:
      return model::RequestStatus::kUnspecified;
  }
}

model::Urgency FromProto(outflow::v1::Urgency urgency) {
  switch (urgency) {
    case URGENCY_URGENT:
      return model::Urgency::kUrgent;
    case URGENCY_EMERGENCY:
      return model::Urgency::kEmergency;
    default:
      return model::Urgency::kNormal;
  }
}

model::ReturnCondition FromProto(outflow::v1::ReturnCondition condition) {
  switch (condition) {
    case RETURN_CONDITION_GOOD:
      return model::ReturnCondition::kGood;
    case RETURN_CONDITION_DAMAGED:
      return model::ReturnCondition::kDamaged;
    case RETURN_CONDITION_DEFECTIVE:
      return model::ReturnCondition::kDefective;
    default:
      throw util::InvalidArgument("return condition must be GOOD, DAMAGED or DEFECTIVE");
  }
}

PartRequest ToProto(const model::SparePartRequest& request) {
  PartRequest out;
  out.set_id(request.id);
  out.set_service_request_id(request.service_request_id);
  out.set_spare_part_id(request.spare_part_id);
  out.set_store_id(request.store_id);
  out.set_technician_id(request.technician_id);
  out.set_requested_quantity(request.requested_quantity);
  out.set_urgency(ToProto(request.urgency));
  out.set_justification(request.justification);
  out.set_status(ToProto(request.status));
  out.set_approval_level(request.approval_level);
  out.set_achieved_level(request.achieved_level);
  out.set_estimated_cost(request.estimated_cost);
  out.set_issued_quantity(request.issued_quantity);
  out.set_issued_cost(request.issued_cost);
  out.set_installed_quantity(request.installed_quantity);
  out.set_returned_quantity(request.returned_quantity);
  out.set_stock_blocked(request.stock_blocked);
  out.set_note(request.note);
  out.set_approved_by(request.approved_by);
  out.set_created_at_ms(request.created_at_ms);
  out.set_updated_at_ms(request.updated_at_ms);
  return out;
}

StockLevel ToProto(const model::InventoryLevel& level) {
  StockLevel out;
  out.set_spare_part_id(level.spare_part_id);
  out.set_store_id(level.store_id);
  out.set_current_stock(level.current_stock);
  out.set_reserved_stock(level.reserved_stock);
  out.set_available_stock(level.available_stock());
  out.set_damaged_stock(level.damaged_stock);
  return out;
}

StockMovement ToProto(const model::StockMovement& movement) {
  StockMovement out;
  out.set_id(movement.id);
  out.set_sequence(movement.sequence);
  out.set_spare_part_id(movement.spare_part_id);
  out.set_store_id(movement.store_id);
  out.set_movement_type(ToProto(movement.movement_type));
  out.set_quantity(movement.quantity);
  out.set_previous_stock(movement.previous_stock);
  out.set_new_stock(movement.new_stock);
  out.set_unit_cost(movement.unit_cost);
  out.set_reference_type(movement.reference_type);
  out.set_reference_id(movement.reference_id);
  out.set_reason(movement.reason);
  out.set_created_by(movement.created_by);
  out.set_created_at_ms(movement.created_at_ms);
  return out;
}

ApprovalEntry ToProto(const model::ApprovalHistory& entry) {
  ApprovalEntry out;
  out.set_id(entry.id);
  out.set_request_id(entry.request_id);
  out.set_level(entry.level);
  out.set_approver_id(entry.approver_id);
  out.set_decision(ToProto(entry.decision));
  out.set_comments(entry.comments);
  out.set_request_value(entry.request_value);
  out.set_available_stock(entry.available_stock);
  out.set_decided_at_ms(entry.decided_at_ms);
  return out;
}

InstalledPart ToProto(const model::InstalledPart& part) {
  InstalledPart out;
  out.set_id(part.id);
  out.set_request_id(part.request_id);
  out.set_service_request_id(part.service_request_id);
  out.set_spare_part_id(part.spare_part_id);
  out.set_technician_id(part.technician_id);
  out.set_quantity(part.quantity);
  out.set_unit_cost(part.unit_cost);
  out.set_total_cost(part.total_cost);
  out.set_selling_price(part.selling_price);
  out.set_total_revenue(part.total_revenue);
  out.set_serial_number(part.serial_number);
  out.set_batch_number(part.batch_number);
  out.set_warranty_months(part.warranty_months);
  out.set_warranty_expires_at_ms(part.warranty_expires_at_ms);
  out.set_installed_at_ms(part.installed_at_ms);
  out.set_replaced_part_id(part.replaced_part_id);
  return out;
}

CostBreakdown ToProto(const model::ServiceCostBreakdown& breakdown) {
  CostBreakdown out;
  out.set_id(breakdown.id);
  out.set_service_request_id(breakdown.service_request_id);
  out.set_version(breakdown.version);
  out.set_parts_cost(breakdown.parts_cost);
  out.set_parts_revenue(breakdown.parts_revenue);
  out.set_parts_markup(breakdown.parts_markup);
  out.set_labor_hours(breakdown.labor_hours);
  out.set_labor_cost(breakdown.labor_cost);
  out.set_labor_markup(breakdown.labor_markup);
  out.set_labor_total(breakdown.labor_total);
  out.set_overhead_cost(breakdown.overhead_cost);
  out.set_subtotal(breakdown.subtotal);
  out.set_tax_percent(breakdown.tax_percent);
  out.set_tax_amount(breakdown.tax_amount);
  out.set_grand_total(breakdown.grand_total);
  out.set_total_revenue(breakdown.total_revenue);
  out.set_total_cost(breakdown.total_cost);
  out.set_net_margin(breakdown.net_margin);
  out.set_margin_percent(breakdown.margin_percent);
  out.set_calculated_at_ms(breakdown.calculated_at_ms);
  for (const auto& line : breakdown.lines) {
    auto* l = out.add_lines();
    l->set_spare_part_id(line.spare_part_id);
    l->set_quantity(line.quantity);
    l->set_unit_cost(line.unit_cost);
    l->set_total_cost(line.total_cost);
    l->set_selling_price(line.selling_price);
    l->set_total_revenue(line.total_revenue);
  }
  return out;
}

} // namespace outflow::service
