#include "request_lifecycle.hpp"

#include <algorithm>
#include <limits>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace outflow::core {

using model::Quantity;
using model::RequestStatus;
using model::SparePartRequest;

namespace {

constexpr const char* kSystemActor = "system";

model::LevelKey KeyOf(const SparePartRequest& request) {
  return {request.spare_part_id, request.store_id};
}

util::ErrorContext RequestContext(const SparePartRequest& request) {
  util::ErrorContext context;
  context.request_id    = request.id;
  context.spare_part_id = request.spare_part_id;
  context.store_id      = request.store_id;
  context.requested     = request.requested_quantity;
  return context;
}

void Transition(SparePartRequest& request, RequestStatus to) {
  if (!model::CanTransition(request.status, to)) {
    throw util::InvalidTransition(std::string("request cannot move from ") + model::ToString(request.status) + " to " + model::ToString(to),
                                  RequestContext(request));
  }
  request.status = to;
}

void RequireStatus(const SparePartRequest& request, RequestStatus expected, const char* action) {
  if (request.status != expected) {
    throw util::InvalidTransition(std::string("cannot ") + action + " a request in state " + model::ToString(request.status), RequestContext(request));
  }
}

// price * quantity, or InvalidArgument when it does not fit in Money.
model::Money CostOf(model::Money price, Quantity quantity, util::ErrorContext context) {
  if (price > 0 && quantity > std::numeric_limits<model::Money>::max() / price) {
    context.requested = quantity;
    throw util::InvalidArgument("quantity " + std::to_string(quantity) + " at price " + std::to_string(price) + " overflows the cost",
                                std::move(context));
  }
  return price * quantity;
}

std::string ShortfallNote(const util::Error& e) {
  const auto& context = e.Context();
  return "Insufficient stock: requested " + std::to_string(context.requested) + ", available " + std::to_string(context.available) +
         ", shortfall " + std::to_string(context.shortfall);
}

void LogTransition(const char* message, const SparePartRequest& request) {
  OUTFLOW_LOG_INFO(message, {observability::StringField("request_id", request.id), observability::StringField("status", model::ToString(request.status)),
                             observability::KeyField({request.spare_part_id, request.store_id}),
                             observability::IntField("quantity", request.requested_quantity),
                             observability::MoneyField("estimated_cost", request.estimated_cost)});
}

} // namespace

RequestLifecycle::RequestLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<inventory::InventoryLedger> ledger,
                                   std::shared_ptr<reservation::ReservationManager> reservations,
                                   std::shared_ptr<approval::ApprovalOrchestrator> approvals, std::shared_ptr<limits::LimitEvaluator> limits,
                                   util::RetryPolicy retry)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      reservations_(std::move(reservations)),
      approvals_(std::move(approvals)),
      limits_(std::move(limits)),
      retry_(std::move(retry)) {
}

SparePartRequest RequestLifecycle::Load(db::Transaction& tx, const std::string& request_id) {
  auto request = repository_->GetRequest(tx, request_id);
  if (!request) {
    util::ErrorContext context;
    context.request_id = request_id;
    throw util::NotFound("request " + request_id + " not found", std::move(context));
  }
  return *request;
}

void RequestLifecycle::Save(db::Transaction& tx, SparePartRequest& request) {
  request.updated_at_ms = util::NowMs();
  db::ThrowIfDbError(repository_->UpdateRequest(tx, request), "update request", RequestContext(request));
}

Quantity RequestLifecycle::AvailableStock(db::Transaction& tx, const model::LevelKey& key) {
  auto level = repository_->GetLevel(tx, key);
  return level ? level->available_stock() : 0;
}

bool RequestLifecycle::ReserveOrBlock(db::Transaction& tx, SparePartRequest& request) {
  if (reservations_->ActiveFor(tx, request.id)) {
    return true;
  }
  try {
    reservations_->ReserveInTx(tx, request.id, KeyOf(request), request.requested_quantity, request.technician_id);
    request.stock_blocked = false;
    request.note.clear();
    return true;
  } catch (const util::InsufficientStock& e) {
    request.stock_blocked = true;
    request.note          = ShortfallNote(e);
    return false;
  } catch (const util::NotFound&) {
    // No level for the store yet; nothing to hold.
    request.stock_blocked = true;
    request.note          = "Insufficient stock: no inventory for " + KeyOf(request).ToString();
    return false;
  }
}

limits::PeriodUsage RequestLifecycle::UsageFor(db::Transaction& tx, const std::string& technician_id, std::uint64_t now_ms) {
  const auto day_start = util::StartOfUtcDayMs(now_ms);

  model::RequestFilter filter;
  filter.technician_id    = technician_id;
  filter.created_since_ms = util::StartOfUtcMonthMs(now_ms);

  limits::PeriodUsage usage;
  for (const auto& request : repository_->FindRequests(tx, filter)) {
    if (request.status == RequestStatus::kRejected) continue;
    usage.month += request.estimated_cost;
    if (request.created_at_ms >= day_start) {
      usage.day += request.estimated_cost;
    }
  }
  return usage;
}

// ------------------------------------------------------------------
// Transitions
// ------------------------------------------------------------------

SparePartRequest RequestLifecycle::Create(const CreateRequestInput& input, const util::CancellationToken* cancel) {
  if (input.requested_quantity <= 0) {
    util::ErrorContext context;
    context.spare_part_id = input.spare_part_id;
    context.requested     = input.requested_quantity;
    throw util::InvalidArgument("requested quantity must be positive", std::move(context));
  }
  if (input.technician_id.empty()) {
    throw util::InvalidArgument("technician id is required");
  }

  model::LevelKey key;
  {
    auto tx      = repository_->Begin();
    auto service = repository_->GetServiceRequest(*tx, input.service_request_id);
    if (!service) {
      throw util::NotFound("service request " + input.service_request_id + " not found");
    }
    if (!repository_->GetSparePart(*tx, input.spare_part_id)) {
      util::ErrorContext context;
      context.spare_part_id = input.spare_part_id;
      throw util::NotFound("spare part " + input.spare_part_id + " not found", std::move(context));
    }
    key = {input.spare_part_id, service->store_id};
  }

  const auto request_id = util::GenerateId();
  auto       key_lock   = ledger_->LockKey(key);

  auto created = util::WithRetry(retry_, [&] {
    auto tx   = repository_->Begin();
    auto part = repository_->GetSparePart(*tx, input.spare_part_id);
    if (!part) {
      throw util::NotFound("spare part " + input.spare_part_id + " not found");
    }

    const auto       now_ms = util::NowMs();
    SparePartRequest request;
    request.id                 = request_id;
    request.service_request_id = input.service_request_id;
    request.spare_part_id      = input.spare_part_id;
    request.store_id           = key.store_id;
    request.technician_id      = input.technician_id;
    request.requested_quantity = input.requested_quantity;
    request.urgency            = input.urgency;
    request.justification      = input.justification;
    request.estimated_cost     = CostOf(part->selling_price, input.requested_quantity, RequestContext(request));
    request.created_at_ms      = now_ms;
    request.updated_at_ms      = now_ms;
    request.version            = 1;

    limits::LimitQuery query;
    query.technician_id      = input.technician_id;
    query.category_id        = part->category_id;
    query.spare_part_id      = input.spare_part_id;
    query.request_value      = request.estimated_cost;
    query.requested_quantity = input.requested_quantity;
    query.usage              = UsageFor(*tx, input.technician_id, now_ms);
    const auto decision      = limits_->Classify(*tx, query);

    Transition(request, RequestStatus::kPending);
    request.approval_level = decision.level;
    if (!decision.violations.empty()) {
      request.note = decision.violations.front();
    }

    // The request row must exist before a reservation can reference it.
    db::ThrowIfDbError(repository_->InsertRequest(*tx, request), "insert request", RequestContext(request));
    const auto available = AvailableStock(*tx, key);

    if (!decision.AutoApproved()) {
      approvals_->RecordDecision(*tx, request, request.approval_level, kSystemActor, model::Decision::kPending, "Awaiting approval", available);
    } else if (ReserveOrBlock(*tx, request)) {
      Transition(request, RequestStatus::kApproved);
      request.approved_by    = kSystemActor;
      request.approved_at_ms = now_ms;
      approvals_->RecordDecision(*tx, request, request.approval_level, kSystemActor, model::Decision::kApproved, "Auto-approved within limits",
                                 available);
      db::ThrowIfDbError(repository_->UpdateRequest(*tx, request), "update request", RequestContext(request));
    } else {
      // Within limits but short of stock; it waits as Pending until stock arrives and an approver acts.
      approvals_->RecordDecision(*tx, request, request.approval_level, kSystemActor, model::Decision::kPending, request.note, available);
      db::ThrowIfDbError(repository_->UpdateRequest(*tx, request), "update request", RequestContext(request));
    }

    util::ThrowIfCancelled(cancel, "create request");
    db::CommitOrThrow(*tx, "create request", RequestContext(request));
    return request;
  });

  LogTransition("part request created", created);
  return created;
}

SparePartRequest RequestLifecycle::Approve(const std::string& request_id, const std::string& approver_id, const std::string& comments,
                                           const util::CancellationToken* cancel) {
  return util::WithRequest(request_id, [&] {
    auto request_lock = request_locks_.Acquire(request_id);
    auto key_lock     = ledger_->LockKey(KeyOf(Get(request_id)));

    auto approved = util::WithRetry(retry_, [&] {
      auto tx      = repository_->Begin();
      auto request = Load(*tx, request_id);
      RequireStatus(request, RequestStatus::kPending, "approve");
      approvals_->RequireRank(*tx, request, approver_id);

      approvals_->RecordDecision(*tx, request, request.approval_level, approver_id, model::Decision::kApproved, comments,
                                 AvailableStock(*tx, KeyOf(request)));
      Transition(request, RequestStatus::kApproved);
      request.approved_by    = approver_id;
      request.approved_at_ms = util::NowMs();
      request.achieved_level = approvals_->ApproverLevel(*tx, approver_id);
      ReserveOrBlock(*tx, request);
      Save(*tx, request);

      util::ThrowIfCancelled(cancel, "approve request");
      db::CommitOrThrow(*tx, "approve request", RequestContext(request));
      return request;
    });

    LogTransition("part request approved", approved);
    if (approved.stock_blocked) {
      OUTFLOW_LOG_WARN("approved request is waiting for stock", {observability::StringField("request_id", approved.id),
                                                                  observability::StringField("note", approved.note)});
    }
    return approved;
  });
}

SparePartRequest RequestLifecycle::Escalate(const std::string& request_id, const std::string& approver_id, std::uint32_t target_level,
                                            const std::string& comments) {
  return util::WithRequest(request_id, [&] {
    auto request_lock = request_locks_.Acquire(request_id);

    auto escalated = util::WithRetry(retry_, [&] {
      auto tx      = repository_->Begin();
      auto request = Load(*tx, request_id);
      RequireStatus(request, RequestStatus::kPending, "escalate");
      if (approvals_->ApproverLevel(*tx, approver_id) < 1) {
        throw util::LimitExceeded("approver " + approver_id + " holds no approval level", RequestContext(request));
      }
      if (target_level <= request.approval_level || target_level > limits_->MaxLevel()) {
        auto context      = RequestContext(request);
        context.requested = target_level;
        throw util::InvalidArgument("escalation target must be above level " + std::to_string(request.approval_level) + " and at most " +
                                        std::to_string(limits_->MaxLevel()),
                                    std::move(context));
      }

      approvals_->RecordDecision(*tx, request, target_level, approver_id, model::Decision::kEscalated, comments,
                                 AvailableStock(*tx, KeyOf(request)));
      request.approval_level = target_level;
      Save(*tx, request);
      db::CommitOrThrow(*tx, "escalate request", RequestContext(request));
      return request;
    });

    OUTFLOW_LOG_INFO("part request escalated", {observability::StringField("request_id", escalated.id),
                                                observability::IntField("approval_level", escalated.approval_level)});
    return escalated;
  });
}

SparePartRequest RequestLifecycle::Reject(const std::string& request_id, const std::string& approver_id, const std::string& reason) {
  return util::WithRequest(request_id, [&] {
    auto request_lock = request_locks_.Acquire(request_id);
    auto key_lock     = ledger_->LockKey(KeyOf(Get(request_id)));

    auto rejected = util::WithRetry(retry_, [&] {
      auto tx      = repository_->Begin();
      auto request = Load(*tx, request_id);
      RequireStatus(request, RequestStatus::kPending, "reject");
      approvals_->RequireRank(*tx, request, approver_id);

      approvals_->RecordDecision(*tx, request, request.approval_level, approver_id, model::Decision::kRejected, reason,
                                 AvailableStock(*tx, KeyOf(request)));
      if (auto reservation = reservations_->ActiveFor(*tx, request.id)) {
        reservations_->ReleaseInTx(*tx, *reservation, "request rejected");
      }
      Transition(request, RequestStatus::kRejected);
      request.note          = reason;
      request.stock_blocked = false;
      Save(*tx, request);
      db::CommitOrThrow(*tx, "reject request", RequestContext(request));
      return request;
    });

    LogTransition("part request rejected", rejected);
    return rejected;
  });
}

SparePartRequest RequestLifecycle::Issue(const std::string& request_id) {
  return util::WithRequest(request_id, [&] {
    auto request_lock = request_locks_.Acquire(request_id);
    auto key_lock     = ledger_->LockKey(KeyOf(Get(request_id)));

    // An expired hold is given back on its own so a failed re-reserve below cannot undo it.
    util::WithRetry(retry_, [&] {
      auto tx          = repository_->Begin();
      auto reservation = reservations_->ActiveFor(*tx, request_id);
      if (!reservation || !reservation->IsExpired(util::NowMs())) {
        return;
      }
      reservations_->ExpireInTx(*tx, *reservation);
      db::CommitOrThrow(*tx, "expire reservation " + reservation->id);
    });

    auto issued = util::WithRetry(retry_, [&] {
      auto tx      = repository_->Begin();
      auto request = Load(*tx, request_id);
      RequireStatus(request, RequestStatus::kApproved, "issue");

      auto part = repository_->GetSparePart(*tx, request.spare_part_id);
      if (!part) {
        throw util::NotFound("spare part " + request.spare_part_id + " not found", RequestContext(request));
      }

      const auto now_ms      = util::NowMs();
      auto       reservation = reservations_->ActiveFor(*tx, request.id);
      if (!reservation) {
        reservation = reservations_->ReserveInTx(*tx, request.id, KeyOf(request), request.requested_quantity, request.technician_id);
      }
      if (reservation->reserved_quantity < request.requested_quantity) {
        auto context      = RequestContext(request);
        context.available = reservation->reserved_quantity;
        context.shortfall = request.requested_quantity - reservation->reserved_quantity;
        throw util::InsufficientStock("reservation does not cover the requested quantity", std::move(context));
      }

      model::MovementReference reference;
      reference.reference_type = model::reference::kService;
      reference.reference_id   = request.service_request_id;
      reference.reason         = "Issued for request " + request.id;
      reference.created_by     = request.technician_id;
      reference.unit_cost      = part->unit_cost;
      reservations_->ConsumeInTx(*tx, *reservation, reference);

      Transition(request, RequestStatus::kIssued);
      request.issued_quantity = request.requested_quantity;
      request.issue_unit_cost = part->unit_cost;
      request.issued_cost     = CostOf(part->unit_cost, request.requested_quantity, RequestContext(request));
      request.issued_at_ms    = now_ms;
      request.stock_blocked   = false;
      request.note.clear();
      Save(*tx, request);
      db::CommitOrThrow(*tx, "issue request", RequestContext(request));
      return request;
    });

    LogTransition("part request issued", issued);
    return issued;
  });
}

model::InstalledPart RequestLifecycle::Install(const std::string& request_id, const InstallInput& input) {
  return util::WithRequest(request_id, [&] {
    auto request_lock = request_locks_.Acquire(request_id);

    auto installed = util::WithRetry(retry_, [&] {
      auto tx      = repository_->Begin();
      auto request = Load(*tx, request_id);
      RequireStatus(request, RequestStatus::kIssued, "install");
      if (input.quantity <= 0 || input.quantity > request.OutstandingQuantity()) {
        auto context      = RequestContext(request);
        context.requested = input.quantity;
        context.available = request.OutstandingQuantity();
        throw util::InvalidArgument("install quantity must be between 1 and the outstanding issued quantity", std::move(context));
      }

      auto part = repository_->GetSparePart(*tx, request.spare_part_id);
      if (!part) {
        throw util::NotFound("spare part " + request.spare_part_id + " not found", RequestContext(request));
      }

      const auto           now_ms = util::NowMs();
      model::InstalledPart installed_part;
      installed_part.id                 = util::GenerateId();
      installed_part.request_id         = request.id;
      installed_part.service_request_id = request.service_request_id;
      installed_part.spare_part_id      = request.spare_part_id;
      installed_part.technician_id      = input.technician_id.empty() ? request.technician_id : input.technician_id;
      installed_part.store_id           = request.store_id;
      installed_part.quantity           = input.quantity;
      installed_part.unit_cost          = input.unit_cost.value_or(request.issue_unit_cost);
      installed_part.total_cost         = CostOf(installed_part.unit_cost, input.quantity, RequestContext(request));
      installed_part.selling_price      = part->selling_price;
      installed_part.total_revenue      = CostOf(part->selling_price, input.quantity, RequestContext(request));
      installed_part.serial_number      = input.serial_number;
      installed_part.batch_number       = input.batch_number;
      installed_part.notes              = input.notes;
      installed_part.replaced_part_id   = input.replaced_part_id;
      installed_part.warranty_months    = part->warranty_months;
      installed_part.installed_at_ms    = now_ms;
      if (part->warranty_months > 0) {
        installed_part.warranty_expires_at_ms = util::AddMonthsMs(now_ms, part->warranty_months);
      }
      db::ThrowIfDbError(repository_->InsertInstalledPart(*tx, installed_part), "insert installed part", RequestContext(request));

      request.installed_quantity += input.quantity;
      Transition(request, request.OutstandingQuantity() == 0 ? RequestStatus::kInstalled : RequestStatus::kIssued);
      Save(*tx, request);
      db::CommitOrThrow(*tx, "install part", RequestContext(request));
      return installed_part;
    });

    OUTFLOW_LOG_INFO("part installed", {observability::StringField("request_id", request_id),
                                        observability::StringField("spare_part_id", installed.spare_part_id),
                                        observability::IntField("quantity", installed.quantity)});
    return installed;
  });
}

void RequestLifecycle::ReturnInTx(db::Transaction& tx, const ReturnLine& line, std::vector<model::StockMovement>& movements) {
  const auto& input   = line.input;
  auto        request = Load(tx, line.request_id);
  RequireStatus(request, RequestStatus::kIssued, "return");
  if (input.quantity <= 0 || input.quantity > request.OutstandingQuantity()) {
    auto context      = RequestContext(request);
    context.requested = input.quantity;
    context.available = request.OutstandingQuantity();
    throw util::InvalidArgument("return quantity must be between 1 and the outstanding issued quantity", std::move(context));
  }
  if (input.unit_cost && *input.unit_cost < 0) {
    throw util::InvalidArgument("return unit cost must not be negative", RequestContext(request));
  }

  const auto actor = input.technician_id.empty() ? request.technician_id : input.technician_id;

  inventory::MovementRequest credit;
  credit.key                      = KeyOf(request);
  credit.type                     = model::MovementType::kIn;
  credit.quantity                 = input.quantity;
  credit.reference.reference_type = model::reference::kReturn;
  credit.reference.reference_id   = request.id;
  credit.reference.reason         = input.reason.empty() ? std::string("Returned ") + model::ToString(input.condition) : input.reason;
  credit.reference.created_by     = actor;
  credit.reference.unit_cost      = input.unit_cost.value_or(request.issue_unit_cost);
  movements.push_back(ledger_->ApplyMovementInTx(tx, credit).movement);

  if (input.condition != model::ReturnCondition::kGood) {
    inventory::MovementRequest quarantine = credit;
    quarantine.type                       = model::MovementType::kAdjustment;
    quarantine.quantity                   = -input.quantity;
    quarantine.damaged_delta              = input.quantity;
    quarantine.reference.reason           = std::string("Quarantined ") + model::ToString(input.condition) + " return";
    movements.push_back(ledger_->ApplyMovementInTx(tx, quarantine).movement);
  }

  if (auto reservation = reservations_->ActiveFor(tx, request.id)) {
    reservations_->ReleaseInTx(tx, *reservation, "parts returned");
  }

  request.returned_quantity += input.quantity;
  if (request.OutstandingQuantity() == 0) {
    Transition(request, request.installed_quantity > 0 ? RequestStatus::kInstalled : RequestStatus::kReturned);
  }
  Save(tx, request);
}

std::vector<model::StockMovement> RequestLifecycle::Return(const std::string& request_id, const ReturnInput& input) {
  return ReturnBatch({ReturnLine{request_id, input}});
}

std::vector<model::StockMovement> RequestLifecycle::ReturnBatch(const std::vector<ReturnLine>& lines) {
  if (lines.empty()) {
    return {};
  }

  std::vector<std::string> request_ids;
  for (const auto& line : lines) {
    request_ids.push_back(line.request_id);
  }
  auto request_locks = request_locks_.AcquireAll(request_ids);

  std::vector<model::LevelKey> keys;
  for (const auto& request_id : request_ids) {
    keys.push_back(util::WithRequest(request_id, [&] { return KeyOf(Get(request_id)); }));
  }
  auto key_locks = ledger_->LockKeys(std::move(keys));

  auto movements = util::WithRetry(retry_, [&] {
    auto                              tx = repository_->Begin();
    std::vector<model::StockMovement> result;
    for (const auto& line : lines) {
      util::WithRequest(line.request_id, [&] { ReturnInTx(*tx, line, result); });
    }
    db::CommitOrThrow(*tx, "return parts");
    return result;
  });

  for (const auto& line : lines) {
    OUTFLOW_LOG_INFO("parts returned", {observability::StringField("request_id", line.request_id),
                                        observability::IntField("quantity", line.input.quantity),
                                        observability::StringField("condition", model::ToString(line.input.condition))});
  }
  return movements;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

SparePartRequest RequestLifecycle::Get(const std::string& request_id) {
  auto tx = repository_->Begin();
  return Load(*tx, request_id);
}

std::vector<SparePartRequest> RequestLifecycle::Find(const model::RequestFilter& filter) {
  auto tx = repository_->Begin();
  return repository_->FindRequests(*tx, filter);
}

} // namespace outflow::core
