#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if OUTFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if OUTFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using outflow::db::ErrorCode;
using outflow::db::Repository;
using outflow::db::Result;
using outflow::db::SerializationError;
using outflow::db::Transaction;
using outflow::db::memory::MemoryRepository;
using outflow::model::ApprovalHistory;
using outflow::model::CostLine;
using outflow::model::Decision;
using outflow::model::InstalledPart;
using outflow::model::InventoryLevel;
using outflow::model::LevelKey;
using outflow::model::MovementType;
using outflow::model::RequestFilter;
using outflow::model::RequestStatus;
using outflow::model::ReservationStatus;
using outflow::model::RoleAssignment;
using outflow::model::ServiceCostBreakdown;
using outflow::model::ServiceRequest;
using outflow::model::SparePart;
using outflow::model::SparePartRequest;
using outflow::model::StockMovement;
using outflow::model::StockReservation;
using outflow::model::TechnicianLimit;
using outflow::model::Urgency;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// A failed statement aborts a postgres transaction, so writes expected to
// fail run in their own transaction and are rolled back.
ErrorCode FailedWrite(Repository& repo, const std::function<Result(Transaction&)>& write) {
  auto tx     = repo.Begin();
  auto result = write(*tx);
  tx->Rollback();
  assert(!result);
  return result.code;
}

SparePartRequest MakeRequest(const std::string& id, const std::string& service_id, const std::string& technician_id, uint64_t created_at_ms) {
  SparePartRequest r;
  r.id                 = id;
  r.service_request_id = service_id;
  r.spare_part_id      = "part-" + service_id;
  r.store_id           = "store-1";
  r.technician_id      = technician_id;
  r.requested_quantity = 2;
  r.urgency            = Urgency::kUrgent;
  r.justification      = "compressor swap";
  r.status             = RequestStatus::kPending;
  r.approval_level     = 2;
  r.estimated_cost     = 10000;
  r.created_at_ms      = created_at_ms;
  r.updated_at_ms      = created_at_ms;
  return r;
}

void VerifyLevelCompareAndSet(Repository& repo, const std::string& part_id) {
  const LevelKey key{part_id, "store-1"};

  auto           tx = repo.Begin();
  InventoryLevel level{.spare_part_id = part_id, .store_id = "store-1", .current_stock = 10, .last_movement_at_ms = NowMs()};
  assert(repo.InsertLevel(*tx, level));
  tx->Commit();

  assert(FailedWrite(repo, [&](Transaction& t) { return repo.InsertLevel(t, level); }) == ErrorCode::AlreadyExists);

  tx        = repo.Begin();
  auto read = repo.GetLevel(*tx, key);
  assert(read.has_value());
  assert(read->current_stock == 10);
  assert(read->available_stock() == 10);

  auto stale           = *read;
  read->reserved_stock = 4;
  assert(repo.UpdateLevel(*tx, *read));
  assert(read->version == level.version + 1);

  stale.current_stock = 99;
  auto conflict       = repo.UpdateLevel(*tx, stale);
  assert(!conflict);
  assert(conflict.code == ErrorCode::Conflict);

  InventoryLevel missing{.spare_part_id = part_id, .store_id = "store-missing"};
  auto           not_found = repo.UpdateLevel(*tx, missing);
  assert(!not_found);
  assert(not_found.code == ErrorCode::NotFound);

  auto after = repo.GetLevel(*tx, key);
  assert(after.has_value());
  assert(after->current_stock == 10);
  assert(after->reserved_stock == 4);
  assert(after->available_stock() == 6);

  bool listed = false;
  for (const auto& l : repo.ListLevels(*tx)) {
    listed = listed || l.Key() == key;
  }
  assert(listed);

  tx->Commit();
}

void VerifyMovementLedger(Repository& repo, const std::string& part_id) {
  const LevelKey key{part_id, "store-1"};

  auto          tx = repo.Begin();
  StockMovement in{.id = part_id + "-m1", .spare_part_id = part_id, .store_id = "store-1", .movement_type = MovementType::kIn,
                   .quantity = 10, .previous_stock = 0, .new_stock = 10, .unit_cost = 5000, .reference_type = "INITIALIZATION",
                   .reference_id = part_id, .reason = "opening stock", .created_by = "admin", .created_at_ms = NowMs()};
  assert(repo.AppendMovement(*tx, in));

  StockMovement out{.id = part_id + "-m2", .spare_part_id = part_id, .store_id = "store-1", .movement_type = MovementType::kOut,
                    .quantity = -3, .previous_stock = 10, .new_stock = 7, .unit_cost = 5000, .reference_type = "SERVICE",
                    .reference_id = "req-1", .reason = "issue", .created_by = "tech-1", .created_at_ms = NowMs()};
  assert(repo.AppendMovement(*tx, out));
  assert(out.sequence > in.sequence);

  StockMovement other{.id = part_id + "-m3", .spare_part_id = part_id, .store_id = "store-2", .movement_type = MovementType::kIn,
                      .quantity = 1, .previous_stock = 0, .new_stock = 1, .reference_type = "TRANSFER", .reference_id = "t-1",
                      .created_at_ms = NowMs()};
  assert(repo.AppendMovement(*tx, other));
  tx->Commit();

  auto read_tx   = repo.Begin();
  auto movements = repo.ListMovements(*read_tx, key);
  assert(movements.size() == 2);
  assert(movements[0].id == in.id);
  assert(movements[0].movement_type == MovementType::kIn);
  assert(movements[1].id == out.id);
  assert(movements[1].quantity == -3);
  assert(movements[1].new_stock == movements[1].previous_stock + movements[1].quantity);
  assert(movements[1].reference_id == "req-1");
  read_tx->Commit();
}

void VerifyRequestReadWrite(Repository& repo, const std::string& prefix) {
  const std::string service_id = prefix + "-svc";
  const uint64_t    base       = NowMs();

  auto tx     = repo.Begin();
  auto first  = MakeRequest(prefix + "-r1", service_id, prefix + "-tech-a", base);
  auto second = MakeRequest(prefix + "-r2", service_id, prefix + "-tech-b", base + 10);
  auto third  = MakeRequest(prefix + "-r3", prefix + "-svc-other", prefix + "-tech-a", base + 20);
  assert(repo.InsertRequest(*tx, first));
  assert(repo.InsertRequest(*tx, second));
  assert(repo.InsertRequest(*tx, third));
  tx->Commit();

  assert(FailedWrite(repo, [&](Transaction& t) { return repo.InsertRequest(t, first); }) == ErrorCode::AlreadyExists);

  tx        = repo.Begin();
  auto read = repo.GetRequest(*tx, first.id);
  assert(read.has_value());
  assert(read->urgency == Urgency::kUrgent);
  assert(read->justification == "compressor swap");

  auto stale             = *read;
  read->status           = RequestStatus::kApproved;
  read->achieved_level   = 2;
  read->approved_by      = "mgr-1";
  read->approved_at_ms   = base + 5;
  read->stock_blocked    = true;
  read->note             = "shortfall 1";
  const auto old_version = read->version;
  assert(repo.UpdateRequest(*tx, *read));
  assert(read->version == old_version + 1);

  stale.status  = RequestStatus::kRejected;
  auto conflict = repo.UpdateRequest(*tx, stale);
  assert(!conflict);
  assert(conflict.code == ErrorCode::Conflict);
  tx->Commit();

  auto read_tx  = repo.Begin();
  auto approved = repo.GetRequest(*read_tx, first.id);
  assert(approved.has_value());
  assert(approved->status == RequestStatus::kApproved);
  assert(approved->approved_by == "mgr-1");
  assert(approved->stock_blocked);
  assert(approved->note == "shortfall 1");

  RequestFilter by_service{.service_request_id = service_id};
  auto          for_service = repo.FindRequests(*read_tx, by_service);
  assert(for_service.size() == 2);
  assert(for_service[0].id == first.id);
  assert(for_service[1].id == second.id);

  RequestFilter by_technician{.technician_id = prefix + "-tech-a", .created_since_ms = base + 15};
  auto          recent = repo.FindRequests(*read_tx, by_technician);
  assert(recent.size() == 1);
  assert(recent[0].id == third.id);

  RequestFilter by_status{.service_request_id = service_id, .status = RequestStatus::kPending};
  auto          pending = repo.FindRequests(*read_tx, by_status);
  assert(pending.size() == 1);
  assert(pending[0].id == second.id);

  assert(!repo.GetRequest(*read_tx, prefix + "-missing").has_value());
  read_tx->Commit();
}

void VerifyReservationReadWrite(Repository& repo, const std::string& prefix) {
  const std::string request_id = prefix + "-req";
  const uint64_t    now        = NowMs();

  auto             tx = repo.Begin();
  StockReservation hold{.id = prefix + "-res1", .request_id = request_id, .spare_part_id = "part-1", .store_id = "store-1",
                        .reserved_quantity = 3, .reserved_for = "tech-1", .status = ReservationStatus::kActive,
                        .reserved_at_ms = now, .expires_at_ms = now + 60000, .updated_at_ms = now};
  assert(repo.InsertReservation(*tx, hold));
  tx->Commit();

  auto second_active = hold;
  second_active.id   = prefix + "-res2";
  assert(FailedWrite(repo, [&](Transaction& t) { return repo.InsertReservation(t, second_active); }) == ErrorCode::ConstraintViolation);

  tx          = repo.Begin();
  auto active = repo.GetActiveReservation(*tx, request_id);
  assert(active.has_value());
  assert(active->id == hold.id);
  assert(active->reserved_quantity == 3);

  hold.status         = ReservationStatus::kReleased;
  hold.release_reason = "rejected";
  hold.updated_at_ms  = now + 1;
  assert(repo.UpdateReservation(*tx, hold));
  assert(!repo.GetActiveReservation(*tx, request_id).has_value());

  assert(repo.InsertReservation(*tx, second_active));
  auto replaced = repo.GetActiveReservation(*tx, request_id);
  assert(replaced.has_value());
  assert(replaced->id == second_active.id);

  StockReservation ghost{.id = prefix + "-ghost", .request_id = "nobody"};
  auto             missing = repo.UpdateReservation(*tx, ghost);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
  tx->Commit();

  auto read_tx  = repo.Begin();
  auto released = repo.GetReservation(*read_tx, hold.id);
  assert(released.has_value());
  assert(released->status == ReservationStatus::kReleased);
  assert(released->release_reason == "rejected");

  bool listed = false;
  for (const auto& r : repo.ListActiveReservations(*read_tx)) {
    assert(r.status == ReservationStatus::kActive);
    listed = listed || r.id == second_active.id;
    assert(r.id != hold.id);
  }
  assert(listed);
  read_tx->Commit();
}

void VerifyApprovalsLimitsRoles(Repository& repo, const std::string& prefix) {
  const std::string request_id = prefix + "-req";
  const std::string principal  = prefix + "-mgr";
  const uint64_t    now        = NowMs();

  auto            tx = repo.Begin();
  ApprovalHistory escalated{.id = prefix + "-h1", .request_id = request_id, .level = 1, .approver_id = "sup-1",
                            .decision = Decision::kEscalated, .comments = "over my limit", .request_value = 200000,
                            .available_stock = 4, .decided_at_ms = now};
  ApprovalHistory approved{.id = prefix + "-h2", .request_id = request_id, .level = 2, .approver_id = "mgr-1",
                           .decision = Decision::kApproved, .request_value = 200000, .available_stock = 4, .decided_at_ms = now + 1};
  assert(repo.InsertApproval(*tx, escalated));
  assert(repo.InsertApproval(*tx, approved));

  TechnicianLimit general{.id = prefix + "-l1", .technician_id = prefix + "-tech", .max_value_per_request = 100000,
                          .max_value_per_day = 500000, .auto_approve_below = 20000, .approver_level = 1};
  TechnicianLimit scoped{.id = prefix + "-l2", .technician_id = prefix + "-tech", .category_id = "compressors",
                         .max_quantity_per_request = 2, .requires_approval = false, .approver_level = 3};
  assert(repo.UpsertLimit(*tx, general));
  assert(repo.UpsertLimit(*tx, scoped));
  general.active = false;
  assert(repo.UpsertLimit(*tx, general));

  RoleAssignment supervisor{.principal_id = principal, .role = "supervisor", .approval_level = 1, .granted_by = "admin", .granted_at_ms = now};
  RoleAssignment manager{.principal_id = principal, .role = "manager", .approval_level = 2, .granted_by = "admin", .granted_at_ms = now};
  assert(repo.UpsertRole(*tx, supervisor));
  assert(repo.UpsertRole(*tx, manager));
  manager.approval_level = 3;
  assert(repo.UpsertRole(*tx, manager));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto history = repo.ListApprovals(*read_tx, request_id);
  assert(history.size() == 2);
  assert(history[0].decision == Decision::kEscalated);
  assert(history[0].comments == "over my limit");
  assert(history[1].decision == Decision::kApproved);
  assert(history[1].level == 2);

  auto limits = repo.ListLimits(*read_tx, prefix + "-tech");
  assert(limits.size() == 2);
  assert(limits[0].id == general.id);
  assert(!limits[0].active);
  assert(limits[0].auto_approve_below == 20000);
  assert(limits[1].category_id == "compressors");
  assert(!limits[1].requires_approval);
  assert(limits[1].approver_level == 3);

  auto roles = repo.ListRoles(*read_tx, principal);
  assert(roles.size() == 2);
  uint32_t max_level = 0;
  for (const auto& r : roles) {
    max_level = std::max(max_level, r.approval_level);
  }
  assert(max_level == 3);
  read_tx->Commit();

  auto revoke_tx = repo.Begin();
  assert(repo.DeleteRole(*revoke_tx, principal, "manager"));
  auto missing = repo.DeleteRole(*revoke_tx, principal, "manager");
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
  auto remaining = repo.ListRoles(*revoke_tx, principal);
  assert(remaining.size() == 1);
  assert(remaining[0].role == "supervisor");
  revoke_tx->Commit();
}

void VerifySettlementReadWrite(Repository& repo, const std::string& prefix) {
  const std::string service_id = prefix + "-svc";
  const uint64_t    now        = NowMs();

  auto          tx = repo.Begin();
  InstalledPart installed{.id = prefix + "-ip1", .request_id = prefix + "-req", .service_request_id = service_id,
                          .spare_part_id = "part-1", .technician_id = "tech-1", .store_id = "store-1", .quantity = 2,
                          .unit_cost = 5000, .total_cost = 10000, .selling_price = 7500, .total_revenue = 15000,
                          .serial_number = "SN-1", .replaced_part_id = "old-1", .warranty_months = 6,
                          .warranty_expires_at_ms = now + 1000, .installed_at_ms = now};
  assert(repo.InsertInstalledPart(*tx, installed));

  ServiceCostBreakdown v1{.id = prefix + "-b1", .service_request_id = service_id, .version = 1, .parts_cost = 10000,
                          .parts_revenue = 15000, .parts_markup = 5000, .labor_hours = 1.5, .labor_rate_per_hour = 50000,
                          .labor_cost = 75000, .labor_markup = 15000, .labor_total = 90000, .labor_markup_percent = 20.0,
                          .overhead_percent = 10.0, .overhead_cost = 8500, .subtotal = 113500, .tax_percent = 18.0,
                          .tax_amount = 20430, .grand_total = 133930, .total_revenue = 113500, .total_cost = 93500,
                          .net_margin = 20000, .margin_percent = 17.62, .calculated_at_ms = now};
  v1.lines.push_back(CostLine{.spare_part_id = "part-1", .quantity = 2, .unit_cost = 5000, .total_cost = 10000,
                              .selling_price = 7500, .total_revenue = 15000});
  assert(repo.InsertBreakdown(*tx, v1));
  tx->Commit();

  assert(FailedWrite(repo, [&](Transaction& t) { return repo.InsertInstalledPart(t, installed); }) == ErrorCode::AlreadyExists);

  auto duplicate_version = v1;
  duplicate_version.id   = prefix + "-b1-dup";
  duplicate_version.lines.clear();
  assert(FailedWrite(repo, [&](Transaction& t) { return repo.InsertBreakdown(t, duplicate_version); }) == ErrorCode::AlreadyExists);

  tx      = repo.Begin();
  auto v2             = v1;
  v2.id               = prefix + "-b2";
  v2.version          = 2;
  v2.labor_hours      = 2.0;
  v2.labor_cost       = 100000;
  v2.grand_total      = 165000;
  v2.calculated_at_ms = now + 1;
  assert(repo.InsertBreakdown(*tx, v2));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto parts   = repo.ListInstalledParts(*read_tx, service_id);
  assert(parts.size() == 1);
  assert(parts[0].serial_number == "SN-1");
  assert(parts[0].replaced_part_id == "old-1");
  assert(parts[0].warranty_months == 6);

  auto latest = repo.GetLatestBreakdown(*read_tx, service_id);
  assert(latest.has_value());
  assert(latest->version == 2);
  assert(latest->labor_cost == 100000);
  assert(latest->lines.size() == 1);

  auto versions = repo.ListBreakdowns(*read_tx, service_id);
  assert(versions.size() == 2);
  assert(versions[0].version == 1);
  assert(versions[0].grand_total == 133930);
  assert(versions[0].margin_percent == 17.62);
  assert(versions[0].lines.size() == 1);
  assert(versions[0].lines[0].total_revenue == 15000);
  assert(versions[1].version == 2);

  assert(!repo.GetLatestBreakdown(*read_tx, prefix + "-svc-none").has_value());
  assert(repo.ListBreakdowns(*read_tx, prefix + "-svc-none").empty());
  read_tx->Commit();
}

void VerifyCatalogReadWrite(Repository& repo, const std::string& prefix) {
  auto      tx = repo.Begin();
  SparePart part{.id = prefix + "-part", .name = "Compressor", .category_id = "compressors", .unit_cost = 5000,
                 .selling_price = 7500, .minimum_stock = 2, .reorder_level = 4, .warranty_months = 6};
  assert(repo.UpsertSparePart(*tx, part));
  part.selling_price = 8000;
  assert(repo.UpsertSparePart(*tx, part));

  ServiceRequest service{.id = prefix + "-svc", .store_id = "store-1", .technician_id = "tech-1", .labor_hours = 1.5};
  assert(repo.UpsertServiceRequest(*tx, service));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto read    = repo.GetSparePart(*read_tx, part.id);
  assert(read.has_value());
  assert(read->selling_price == 8000);
  assert(read->category_id == "compressors");
  assert(read->warranty_months == 6);

  auto svc = repo.GetServiceRequest(*read_tx, service.id);
  assert(svc.has_value());
  assert(svc->store_id == "store-1");
  assert(svc->labor_hours == 1.5);

  assert(!repo.GetSparePart(*read_tx, prefix + "-missing").has_value());
  read_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& part_id) {
  {
    auto           tx = repo.Begin();
    InventoryLevel level{.spare_part_id = part_id, .store_id = "store-1", .current_stock = 5};
    assert(repo.InsertLevel(*tx, level));
    assert(repo.InsertRequest(*tx, MakeRequest(part_id + "-req", part_id + "-svc", "tech-1", NowMs())));
    tx->Rollback();
  }

  {
    // dropped without Commit
    auto           tx = repo.Begin();
    InventoryLevel level{.spare_part_id = part_id, .store_id = "store-2", .current_stock = 5};
    assert(repo.InsertLevel(*tx, level));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetLevel(*check_tx, LevelKey{part_id, "store-1"}).has_value());
  assert(!repo.GetLevel(*check_tx, LevelKey{part_id, "store-2"}).has_value());
  assert(!repo.GetRequest(*check_tx, part_id + "-req").has_value());
  check_tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& part_id, bool supports_parallel_transactions) {
  const LevelKey key{part_id, "store-1"};
  {
    auto           tx = repo.Begin();
    InventoryLevel seed{.spare_part_id = part_id, .store_id = "store-1", .current_stock = 10};
    assert(repo.InsertLevel(*tx, seed));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    // A second writer gives up after the busy timeout with a retryable error.
    bool        threw = false;
    std::thread contender([&]() {
      try {
        auto tx2 = repo.Begin();
        (void)tx2;
      } catch (const outflow::util::StaleState&) {
        threw = true;
      }
    });
    contender.join();
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto l1 = repo.GetLevel(*tx1, key);
  auto l2 = repo.GetLevel(*tx2, key);
  assert(l1.has_value() && l2.has_value());

  l1->reserved_stock = 3;
  assert(repo.UpdateLevel(*tx1, *l1));
  tx1->Commit();

  // The second writer read the same version; it must lose, either at the
  // compare-and-set or at commit.
  l2->reserved_stock = 7;
  bool lost          = false;
  auto second        = repo.UpdateLevel(*tx2, *l2);
  if (!second) {
    assert(second.code == ErrorCode::Conflict);
    lost = true;
    tx2->Rollback();
  } else {
    try {
      tx2->Commit();
    } catch (const SerializationError&) {
      lost = true;
    }
  }
  assert(lost);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetLevel(*verify_tx, key);
  assert(final.has_value());
  assert(final->reserved_stock == 3);
  verify_tx->Commit();
}

// Overlapping transactions that write different levels both commit.
void VerifyDisjointWritesCommit(Repository& repo, const std::string& prefix, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }
  const LevelKey first{prefix + "-a", "store-1"};
  const LevelKey second{prefix + "-b", "store-1"};
  {
    auto tx = repo.Begin();
    assert(repo.InsertLevel(*tx, InventoryLevel{.spare_part_id = first.spare_part_id, .store_id = "store-1", .current_stock = 5}));
    assert(repo.InsertLevel(*tx, InventoryLevel{.spare_part_id = second.spare_part_id, .store_id = "store-1", .current_stock = 5}));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  auto l1  = repo.GetLevel(*tx1, first);
  auto l2  = repo.GetLevel(*tx2, second);
  l1->reserved_stock = 1;
  l2->reserved_stock = 2;
  assert(repo.UpdateLevel(*tx1, *l1));
  assert(repo.UpdateLevel(*tx2, *l2));
  tx1->Commit();
  tx2->Commit();

  auto verify_tx = repo.Begin();
  assert(repo.GetLevel(*verify_tx, first)->reserved_stock == 1);
  assert(repo.GetLevel(*verify_tx, second)->reserved_stock == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    InventoryLevel level{.spare_part_id = prefix + "-part", .store_id = "store-1", .current_stock = 8, .reserved_stock = 2, .damaged_stock = 1};
    assert(repo->InsertLevel(*tx, level));

    StockMovement movement{.id = prefix + "-m1", .spare_part_id = level.spare_part_id, .store_id = "store-1",
                           .movement_type = MovementType::kIn, .quantity = 8, .previous_stock = 0, .new_stock = 8,
                           .reference_type = "RECEIPT", .reference_id = "po-1", .created_at_ms = NowMs()};
    assert(repo->AppendMovement(*tx, movement));

    auto request            = MakeRequest(prefix + "-req", prefix + "-svc", "tech-1", NowMs());
    request.status          = RequestStatus::kIssued;
    request.issued_quantity = 2;
    assert(repo->InsertRequest(*tx, request));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  auto level = repo->GetLevel(*tx, LevelKey{prefix + "-part", "store-1"});
  assert(level.has_value());
  assert(level->current_stock == 8);
  assert(level->reserved_stock == 2);
  assert(level->damaged_stock == 1);

  auto movements = repo->ListMovements(*tx, LevelKey{prefix + "-part", "store-1"});
  assert(movements.size() == 1);
  assert(movements[0].reference_id == "po-1");

  auto request = repo->GetRequest(*tx, prefix + "-req");
  assert(request.has_value());
  assert(request->status == RequestStatus::kIssued);
  assert(request->issued_quantity == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if OUTFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("outflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    outflow::db::sqlite::SqliteOptions options;
    options.busy_timeout = std::chrono::milliseconds(100);

    auto db = std::make_shared<outflow::db::sqlite::SqliteDB>(db_path, options);
    outflow::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<outflow::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if OUTFLOW_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("OUTFLOW_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("OUTFLOW_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<outflow::db::postgres::PgPool>(conninfo);
    outflow::db::postgres::BootstrapSchema(*pool);
    return std::make_shared<outflow::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Postgres keeps rows between runs; every key carries the run stamp.
  const std::string run = backend.name + "-" + std::to_string(NowMs());

  VerifyLevelCompareAndSet(*repo, run + "-level");
  VerifyMovementLedger(*repo, run + "-ledger");
  VerifyRequestReadWrite(*repo, run + "-request");
  VerifyReservationReadWrite(*repo, run + "-reservation");
  VerifyApprovalsLimitsRoles(*repo, run + "-approval");
  VerifySettlementReadWrite(*repo, run + "-settlement");
  VerifyCatalogReadWrite(*repo, run + "-catalog");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentUpdates(*repo, run + "-concurrency", backend.supports_parallel_transactions);
  VerifyDisjointWritesCommit(*repo, run + "-disjoint", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if OUTFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if OUTFLOW_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "outflow_integration_repository_parity: pass\n";
  return 0;
}
