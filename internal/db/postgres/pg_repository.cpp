#include "pg_repository.hpp"

#include <string_view>

namespace outflow::db::postgres {

namespace {

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

constexpr const char* kLevelColumns = "spare_part_id,store_id,current_stock,reserved_stock,damaged_stock,version,last_movement_at_ms";

model::InventoryLevel ReadLevel(const pqxx::row& row) {
  model::InventoryLevel l;
  l.spare_part_id       = Text(row[0]);
  l.store_id            = Text(row[1]);
  l.current_stock       = row[2].as<int64_t>();
  l.reserved_stock      = row[3].as<int64_t>();
  l.damaged_stock       = row[4].as<int64_t>();
  l.version             = row[5].as<uint64_t>();
  l.last_movement_at_ms = row[6].as<uint64_t>();
  return l;
}

constexpr const char* kMovementColumns =
    "sequence,id,spare_part_id,store_id,movement_type,quantity,previous_stock,new_stock,unit_cost,reference_type,reference_id,reason,created_by,"
    "created_at_ms";

model::StockMovement ReadMovement(const pqxx::row& row) {
  model::StockMovement m;
  m.sequence       = row[0].as<uint64_t>();
  m.id             = Text(row[1]);
  m.spare_part_id  = Text(row[2]);
  m.store_id       = Text(row[3]);
  m.movement_type  = static_cast<model::MovementType>(row[4].as<int>());
  m.quantity       = row[5].as<int64_t>();
  m.previous_stock = row[6].as<int64_t>();
  m.new_stock      = row[7].as<int64_t>();
  m.unit_cost      = row[8].as<int64_t>();
  m.reference_type = Text(row[9]);
  m.reference_id   = Text(row[10]);
  m.reason         = Text(row[11]);
  m.created_by     = Text(row[12]);
  m.created_at_ms  = row[13].as<uint64_t>();
  return m;
}

constexpr const char* kRequestColumns =
    "id,service_request_id,spare_part_id,store_id,technician_id,requested_quantity,urgency,justification,status,approval_level,achieved_level,"
    "estimated_cost,issued_quantity,issue_unit_cost,issued_cost,installed_quantity,returned_quantity,stock_blocked,note,approved_by,approved_at_ms,"
    "issued_at_ms,created_at_ms,updated_at_ms,version";

model::SparePartRequest ReadRequest(const pqxx::row& row) {
  model::SparePartRequest r;
  r.id                 = Text(row[0]);
  r.service_request_id = Text(row[1]);
  r.spare_part_id      = Text(row[2]);
  r.store_id           = Text(row[3]);
  r.technician_id      = Text(row[4]);
  r.requested_quantity = row[5].as<int64_t>();
  r.urgency            = static_cast<model::Urgency>(row[6].as<int>());
  r.justification      = Text(row[7]);
  r.status             = static_cast<model::RequestStatus>(row[8].as<int>());
  r.approval_level     = row[9].as<uint32_t>();
  r.achieved_level     = row[10].as<uint32_t>();
  r.estimated_cost     = row[11].as<int64_t>();
  r.issued_quantity    = row[12].as<int64_t>();
  r.issue_unit_cost    = row[13].as<int64_t>();
  r.issued_cost        = row[14].as<int64_t>();
  r.installed_quantity = row[15].as<int64_t>();
  r.returned_quantity  = row[16].as<int64_t>();
  r.stock_blocked      = row[17].as<bool>();
  r.note               = Text(row[18]);
  r.approved_by        = Text(row[19]);
  r.approved_at_ms     = row[20].as<uint64_t>();
  r.issued_at_ms       = row[21].as<uint64_t>();
  r.created_at_ms      = row[22].as<uint64_t>();
  r.updated_at_ms      = row[23].as<uint64_t>();
  r.version            = row[24].as<uint64_t>();
  return r;
}

constexpr const char* kReservationColumns =
    "id,request_id,spare_part_id,store_id,reserved_quantity,reserved_for,status,release_reason,reserved_at_ms,expires_at_ms,updated_at_ms";

model::StockReservation ReadReservation(const pqxx::row& row) {
  model::StockReservation r;
  r.id                = Text(row[0]);
  r.request_id        = Text(row[1]);
  r.spare_part_id     = Text(row[2]);
  r.store_id          = Text(row[3]);
  r.reserved_quantity = row[4].as<int64_t>();
  r.reserved_for      = Text(row[5]);
  r.status            = static_cast<model::ReservationStatus>(row[6].as<int>());
  r.release_reason    = Text(row[7]);
  r.reserved_at_ms    = row[8].as<uint64_t>();
  r.expires_at_ms     = row[9].as<uint64_t>();
  r.updated_at_ms     = row[10].as<uint64_t>();
  return r;
}

constexpr const char* kApprovalColumns = "id,request_id,level,approver_id,decision,comments,request_value,available_stock,decided_at_ms";

model::ApprovalHistory ReadApproval(const pqxx::row& row) {
  model::ApprovalHistory h;
  h.id              = Text(row[0]);
  h.request_id      = Text(row[1]);
  h.level           = row[2].as<uint32_t>();
  h.approver_id     = Text(row[3]);
  h.decision        = static_cast<model::Decision>(row[4].as<int>());
  h.comments        = Text(row[5]);
  h.request_value   = row[6].as<int64_t>();
  h.available_stock = row[7].as<int64_t>();
  h.decided_at_ms   = row[8].as<uint64_t>();
  return h;
}

constexpr const char* kLimitColumns =
    "id,technician_id,category_id,spare_part_id,max_value_per_request,max_quantity_per_request,max_value_per_day,max_value_per_month,"
    "auto_approve_below,requires_approval,approver_level,active";

model::TechnicianLimit ReadLimit(const pqxx::row& row) {
  model::TechnicianLimit l;
  l.id                       = Text(row[0]);
  l.technician_id            = Text(row[1]);
  l.category_id              = Text(row[2]);
  l.spare_part_id            = Text(row[3]);
  l.max_value_per_request    = row[4].as<int64_t>();
  l.max_quantity_per_request = row[5].as<int64_t>();
  l.max_value_per_day        = row[6].as<int64_t>();
  l.max_value_per_month      = row[7].as<int64_t>();
  l.auto_approve_below       = row[8].as<int64_t>();
  l.requires_approval        = row[9].as<bool>();
  l.approver_level           = row[10].as<uint32_t>();
  l.active                   = row[11].as<bool>();
  return l;
}

constexpr const char* kInstalledColumns =
    "id,request_id,service_request_id,spare_part_id,technician_id,store_id,quantity,unit_cost,total_cost,selling_price,total_revenue,"
    "serial_number,batch_number,notes,replaced_part_id,warranty_months,warranty_expires_at_ms,installed_at_ms";

model::InstalledPart ReadInstalled(const pqxx::row& row) {
  model::InstalledPart p;
  p.id                     = Text(row[0]);
  p.request_id             = Text(row[1]);
  p.service_request_id     = Text(row[2]);
  p.spare_part_id          = Text(row[3]);
  p.technician_id          = Text(row[4]);
  p.store_id               = Text(row[5]);
  p.quantity               = row[6].as<int64_t>();
  p.unit_cost              = row[7].as<int64_t>();
  p.total_cost             = row[8].as<int64_t>();
  p.selling_price          = row[9].as<int64_t>();
  p.total_revenue          = row[10].as<int64_t>();
  p.serial_number          = Text(row[11]);
  p.batch_number           = Text(row[12]);
  p.notes                  = Text(row[13]);
  p.replaced_part_id       = Text(row[14]);
  p.warranty_months        = row[15].as<uint32_t>();
  p.warranty_expires_at_ms = row[16].as<uint64_t>();
  p.installed_at_ms        = row[17].as<uint64_t>();
  return p;
}

constexpr const char* kBreakdownColumns =
    "id,service_request_id,version,parts_cost,parts_revenue,parts_markup,labor_hours,labor_rate_per_hour,labor_cost,labor_markup,labor_total,"
    "labor_markup_percent,overhead_percent,overhead_cost,subtotal,tax_percent,tax_amount,grand_total,total_revenue,total_cost,net_margin,"
    "margin_percent,calculated_at_ms";

model::ServiceCostBreakdown ReadBreakdown(const pqxx::row& row) {
  model::ServiceCostBreakdown b;
  b.id                   = Text(row[0]);
  b.service_request_id   = Text(row[1]);
  b.version              = row[2].as<uint32_t>();
  b.parts_cost           = row[3].as<int64_t>();
  b.parts_revenue        = row[4].as<int64_t>();
  b.parts_markup         = row[5].as<int64_t>();
  b.labor_hours          = row[6].as<double>();
  b.labor_rate_per_hour  = row[7].as<int64_t>();
  b.labor_cost           = row[8].as<int64_t>();
  b.labor_markup         = row[9].as<int64_t>();
  b.labor_total          = row[10].as<int64_t>();
  b.labor_markup_percent = row[11].as<double>();
  b.overhead_percent     = row[12].as<double>();
  b.overhead_cost        = row[13].as<int64_t>();
  b.subtotal             = row[14].as<int64_t>();
  b.tax_percent          = row[15].as<double>();
  b.tax_amount           = row[16].as<int64_t>();
  b.grand_total          = row[17].as<int64_t>();
  b.total_revenue        = row[18].as<int64_t>();
  b.total_cost           = row[19].as<int64_t>();
  b.net_margin           = row[20].as<int64_t>();
  b.margin_percent       = row[21].as<double>();
  b.calculated_at_ms     = row[22].as<uint64_t>();
  return b;
}

template <typename T, typename ReadFn>
std::vector<T> Collect(const pqxx::result& res, ReadFn read) {
  std::vector<T> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(read(row));
  return out;
}

template <typename T, typename ReadFn>
std::optional<T> First(const pqxx::result& res, ReadFn read) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

std::string Sql(std::initializer_list<std::string> parts) {
  std::string out;
  for (const auto& p : parts)
    out += p;
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e) != nullptr) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Inventory levels + movement ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLevel(Transaction& t, const model::InventoryLevel& l) {
  try {
    TX(t).Work().exec_params(Sql({"INSERT INTO inventory_level(", kLevelColumns, ") VALUES($1,$2,$3,$4,$5,$6,$7);"}), l.spare_part_id, l.store_id,
                             l.current_stock, l.reserved_stock, l.damaged_stock, I64(l.version), I64(l.last_movement_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InventoryLevel> PgRepository::GetLevel(Transaction& t, const model::LevelKey& key) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kLevelColumns, " FROM inventory_level WHERE spare_part_id=$1 AND store_id=$2;"}),
                                      key.spare_part_id, key.store_id);
  return First<model::InventoryLevel>(res, ReadLevel);
}

Result PgRepository::UpdateLevel(Transaction& t, model::InventoryLevel& l) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE inventory_level SET current_stock=$3,reserved_stock=$4,damaged_stock=$5,version=version+1,last_movement_at_ms=$7 "
        "WHERE spare_part_id=$1 AND store_id=$2 AND version=$6;",
        l.spare_part_id, l.store_id, l.current_stock, l.reserved_stock, l.damaged_stock, I64(l.version), I64(l.last_movement_at_ms));
    if (res.affected_rows() == 0) {
      if (!GetLevel(t, l.Key())) return Result::Err(ErrorCode::NotFound, l.Key().ToString());
      return Result::Err(ErrorCode::Conflict, "inventory level version mismatch for " + l.Key().ToString());
    }
    l.version++;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::InventoryLevel> PgRepository::ListLevels(Transaction& t) {
  auto res = TX(t).Work().exec(Sql({"SELECT ", kLevelColumns, " FROM inventory_level ORDER BY spare_part_id, store_id;"}));
  return Collect<model::InventoryLevel>(res, ReadLevel);
}

Result PgRepository::AppendMovement(Transaction& t, model::StockMovement& m) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO stock_movement(id,spare_part_id,store_id,movement_type,quantity,previous_stock,new_stock,unit_cost,reference_type,"
        "reference_id,reason,created_by,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13) RETURNING sequence;",
        m.id, m.spare_part_id, m.store_id, static_cast<int>(m.movement_type), m.quantity, m.previous_stock, m.new_stock, m.unit_cost,
        m.reference_type, m.reference_id, m.reason, m.created_by, I64(m.created_at_ms));
    m.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::StockMovement> PgRepository::ListMovements(Transaction& t, const model::LevelKey& key) {
  auto res = TX(t).Work().exec_params(
      Sql({"SELECT ", kMovementColumns, " FROM stock_movement WHERE spare_part_id=$1 AND store_id=$2 ORDER BY sequence;"}), key.spare_part_id,
      key.store_id);
  return Collect<model::StockMovement>(res, ReadMovement);
}

// ------------------------------------------------------------------
// Requests + reservations
// ------------------------------------------------------------------

Result PgRepository::InsertRequest(Transaction& t, const model::SparePartRequest& r) {
  try {
    TX(t).Work().exec_params(Sql({"INSERT INTO part_request(", kRequestColumns,
                                  ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22,$23,$24,$25);"}),
                             r.id, r.service_request_id, r.spare_part_id, r.store_id, r.technician_id, r.requested_quantity,
                             static_cast<int>(r.urgency), r.justification, static_cast<int>(r.status), static_cast<int64_t>(r.approval_level),
                             static_cast<int64_t>(r.achieved_level), r.estimated_cost, r.issued_quantity, r.issue_unit_cost, r.issued_cost,
                             r.installed_quantity, r.returned_quantity, r.stock_blocked, r.note, r.approved_by, I64(r.approved_at_ms),
                             I64(r.issued_at_ms), I64(r.created_at_ms), I64(r.updated_at_ms), I64(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SparePartRequest> PgRepository::GetRequest(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kRequestColumns, " FROM part_request WHERE id=$1;"}), id);
  return First<model::SparePartRequest>(res, ReadRequest);
}

Result PgRepository::UpdateRequest(Transaction& t, model::SparePartRequest& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE part_request SET status=$2,approval_level=$3,achieved_level=$4,issued_quantity=$5,issue_unit_cost=$6,issued_cost=$7,"
        "installed_quantity=$8,returned_quantity=$9,stock_blocked=$10,note=$11,approved_by=$12,approved_at_ms=$13,issued_at_ms=$14,"
        "updated_at_ms=$15,version=version+1 WHERE id=$1 AND version=$16;",
        r.id, static_cast<int>(r.status), static_cast<int64_t>(r.approval_level), static_cast<int64_t>(r.achieved_level), r.issued_quantity,
        r.issue_unit_cost, r.issued_cost, r.installed_quantity, r.returned_quantity, r.stock_blocked, r.note, r.approved_by,
        I64(r.approved_at_ms), I64(r.issued_at_ms), I64(r.updated_at_ms), I64(r.version));
    if (res.affected_rows() == 0) {
      if (!GetRequest(t, r.id)) return Result::Err(ErrorCode::NotFound, r.id);
      return Result::Err(ErrorCode::Conflict, "request version mismatch for " + r.id);
    }
    r.version++;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SparePartRequest> PgRepository::FindRequests(Transaction& t, const model::RequestFilter& f) {
  // Unset filters bind NULL and match everything.
  auto res = TX(t).Work().exec_params(
      Sql({"SELECT ", kRequestColumns,
           " FROM part_request WHERE ($1::text IS NULL OR service_request_id=$1) AND ($2::text IS NULL OR spare_part_id=$2) "
           "AND ($3::text IS NULL OR technician_id=$3) AND ($4::smallint IS NULL OR status=$4) AND ($5::bigint IS NULL OR created_at_ms>=$5) "
           "ORDER BY created_at_ms, id;"}),
      f.service_request_id, f.spare_part_id, f.technician_id,
      f.status ? std::optional<int>(static_cast<int>(*f.status)) : std::nullopt,
      f.created_since_ms ? std::optional<int64_t>(I64(*f.created_since_ms)) : std::nullopt);
  return Collect<model::SparePartRequest>(res, ReadRequest);
}

Result PgRepository::InsertReservation(Transaction& t, const model::StockReservation& r) {
  try {
    TX(t).Work().exec_params(Sql({"INSERT INTO stock_reservation(", kReservationColumns, ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);"}), r.id,
                             r.request_id, r.spare_part_id, r.store_id, r.reserved_quantity, r.reserved_for, static_cast<int>(r.status),
                             r.release_reason, I64(r.reserved_at_ms), I64(r.expires_at_ms), I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    // second active hold for the request, not a duplicate id
    if (std::string_view(e.what()).find("stock_reservation_one_active") != std::string_view::npos) {
      return Result::Err(ErrorCode::ConstraintViolation, e.what());
    }
    return Translate(e);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::StockReservation> PgRepository::GetReservation(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kReservationColumns, " FROM stock_reservation WHERE id=$1;"}), id);
  return First<model::StockReservation>(res, ReadReservation);
}

std::optional<model::StockReservation> PgRepository::GetActiveReservation(Transaction& t, const std::string& request_id) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kReservationColumns, " FROM stock_reservation WHERE request_id=$1 AND status=$2;"}),
                                      request_id, static_cast<int>(model::ReservationStatus::kActive));
  return First<model::StockReservation>(res, ReadReservation);
}

Result PgRepository::UpdateReservation(Transaction& t, const model::StockReservation& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE stock_reservation SET reserved_quantity=$2,status=$3,release_reason=$4,expires_at_ms=$5,updated_at_ms=$6 WHERE id=$1;", r.id,
        r.reserved_quantity, static_cast<int>(r.status), r.release_reason, I64(r.expires_at_ms), I64(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::StockReservation> PgRepository::ListActiveReservations(Transaction& t) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kReservationColumns, " FROM stock_reservation WHERE status=$1 ORDER BY expires_at_ms;"}),
                                      static_cast<int>(model::ReservationStatus::kActive));
  return Collect<model::StockReservation>(res, ReadReservation);
}

// ------------------------------------------------------------------
// Approval trail, limits, roles
// ------------------------------------------------------------------

Result PgRepository::InsertApproval(Transaction& t, const model::ApprovalHistory& h) {
  try {
    TX(t).Work().exec_params(Sql({"INSERT INTO approval_history(", kApprovalColumns, ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);"}), h.id, h.request_id,
                             static_cast<int64_t>(h.level), h.approver_id, static_cast<int>(h.decision), h.comments, h.request_value,
                             h.available_stock, I64(h.decided_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ApprovalHistory> PgRepository::ListApprovals(Transaction& t, const std::string& request_id) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kApprovalColumns, " FROM approval_history WHERE request_id=$1 ORDER BY seq;"}), request_id);
  return Collect<model::ApprovalHistory>(res, ReadApproval);
}

Result PgRepository::UpsertLimit(Transaction& t, const model::TechnicianLimit& l) {
  try {
    TX(t).Work().exec_params(
        Sql({"INSERT INTO technician_limit(", kLimitColumns,
             ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) ON CONFLICT(id) DO UPDATE SET technician_id=EXCLUDED.technician_id,"
             "category_id=EXCLUDED.category_id,spare_part_id=EXCLUDED.spare_part_id,max_value_per_request=EXCLUDED.max_value_per_request,"
             "max_quantity_per_request=EXCLUDED.max_quantity_per_request,max_value_per_day=EXCLUDED.max_value_per_day,"
             "max_value_per_month=EXCLUDED.max_value_per_month,auto_approve_below=EXCLUDED.auto_approve_below,"
             "requires_approval=EXCLUDED.requires_approval,approver_level=EXCLUDED.approver_level,active=EXCLUDED.active;"}),
        l.id, l.technician_id, l.category_id, l.spare_part_id, l.max_value_per_request, l.max_quantity_per_request, l.max_value_per_day,
        l.max_value_per_month, l.auto_approve_below, l.requires_approval, static_cast<int64_t>(l.approver_level), l.active);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TechnicianLimit> PgRepository::ListLimits(Transaction& t, const std::string& technician_id) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kLimitColumns, " FROM technician_limit WHERE technician_id=$1 ORDER BY id;"}), technician_id);
  return Collect<model::TechnicianLimit>(res, ReadLimit);
}

Result PgRepository::UpsertRole(Transaction& t, const model::RoleAssignment& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO role_assignment(principal_id,role,approval_level,granted_by,granted_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(principal_id,role) DO UPDATE SET approval_level=EXCLUDED.approval_level,granted_by=EXCLUDED.granted_by,"
        "granted_at_ms=EXCLUDED.granted_at_ms;",
        r.principal_id, r.role, static_cast<int64_t>(r.approval_level), r.granted_by, I64(r.granted_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRole(Transaction& t, const std::string& principal_id, const std::string& role) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM role_assignment WHERE principal_id=$1 AND role=$2;", principal_id, role);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, principal_id + "/" + role);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RoleAssignment> PgRepository::ListRoles(Transaction& t, const std::string& principal_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT principal_id,role,approval_level,granted_by,granted_at_ms FROM role_assignment WHERE principal_id=$1 ORDER BY role;", principal_id);
  return Collect<model::RoleAssignment>(res, [](const pqxx::row& row) {
    model::RoleAssignment r;
    r.principal_id   = Text(row[0]);
    r.role           = Text(row[1]);
    r.approval_level = row[2].as<uint32_t>();
    r.granted_by     = Text(row[3]);
    r.granted_at_ms  = row[4].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Installations + settlements
// ------------------------------------------------------------------

Result PgRepository::InsertInstalledPart(Transaction& t, const model::InstalledPart& p) {
  try {
    TX(t).Work().exec_params(Sql({"INSERT INTO installed_part(", kInstalledColumns,
                                  ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18);"}),
                             p.id, p.request_id, p.service_request_id, p.spare_part_id, p.technician_id, p.store_id, p.quantity, p.unit_cost,
                             p.total_cost, p.selling_price, p.total_revenue, p.serial_number, p.batch_number, p.notes, p.replaced_part_id,
                             static_cast<int64_t>(p.warranty_months), I64(p.warranty_expires_at_ms), I64(p.installed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::InstalledPart> PgRepository::ListInstalledParts(Transaction& t, const std::string& service_request_id) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kInstalledColumns, " FROM installed_part WHERE service_request_id=$1 ORDER BY seq;"}),
                                      service_request_id);
  return Collect<model::InstalledPart>(res, ReadInstalled);
}

Result PgRepository::InsertBreakdown(Transaction& t, const model::ServiceCostBreakdown& b) {
  try {
    auto& work = TX(t).Work();
    work.exec_params(Sql({"INSERT INTO cost_breakdown(", kBreakdownColumns,
                          ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22,$23);"}),
                     b.id, b.service_request_id, static_cast<int64_t>(b.version), b.parts_cost, b.parts_revenue, b.parts_markup, b.labor_hours,
                     b.labor_rate_per_hour, b.labor_cost, b.labor_markup, b.labor_total, b.labor_markup_percent, b.overhead_percent,
                     b.overhead_cost, b.subtotal, b.tax_percent, b.tax_amount, b.grand_total, b.total_revenue, b.total_cost, b.net_margin,
                     b.margin_percent, I64(b.calculated_at_ms));
    for (size_t i = 0; i < b.lines.size(); ++i) {
      const auto& line = b.lines[i];
      work.exec_params(
          "INSERT INTO cost_breakdown_line(breakdown_id,line_no,spare_part_id,quantity,unit_cost,total_cost,selling_price,total_revenue) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
          b.id, static_cast<int64_t>(i), line.spare_part_id, line.quantity, line.unit_cost, line.total_cost, line.selling_price,
          line.total_revenue);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

void PgRepository::LoadLines(Transaction& t, model::ServiceCostBreakdown& b) {
  auto res = TX(t).Work().exec_params(
      "SELECT spare_part_id,quantity,unit_cost,total_cost,selling_price,total_revenue FROM cost_breakdown_line WHERE breakdown_id=$1 "
      "ORDER BY line_no;",
      b.id);
  b.lines = Collect<model::CostLine>(res, [](const pqxx::row& row) {
    model::CostLine line;
    line.spare_part_id = Text(row[0]);
    line.quantity      = row[1].as<int64_t>();
    line.unit_cost     = row[2].as<int64_t>();
    line.total_cost    = row[3].as<int64_t>();
    line.selling_price = row[4].as<int64_t>();
    line.total_revenue = row[5].as<int64_t>();
    return line;
  });
}

std::vector<model::ServiceCostBreakdown> PgRepository::SelectBreakdowns(Transaction& t, const std::string& service_request_id, bool latest_only) {
  auto res = TX(t).Work().exec_params(Sql({"SELECT ", kBreakdownColumns, " FROM cost_breakdown WHERE service_request_id=$1 ORDER BY version",
                                           latest_only ? " DESC LIMIT 1;" : ";"}),
                                      service_request_id);
  auto breakdowns = Collect<model::ServiceCostBreakdown>(res, ReadBreakdown);
  for (auto& b : breakdowns)
    LoadLines(t, b);
  return breakdowns;
}

std::optional<model::ServiceCostBreakdown> PgRepository::GetLatestBreakdown(Transaction& t, const std::string& service_request_id) {
  auto breakdowns = SelectBreakdowns(t, service_request_id, true);
  if (breakdowns.empty()) return std::nullopt;
  return breakdowns.front();
}

std::vector<model::ServiceCostBreakdown> PgRepository::ListBreakdowns(Transaction& t, const std::string& service_request_id) {
  return SelectBreakdowns(t, service_request_id, false);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::UpsertSparePart(Transaction& t, const model::SparePart& p) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO spare_part(id,name,category_id,unit_cost,selling_price,minimum_stock,reorder_level,warranty_months) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,category_id=EXCLUDED.category_id,"
        "unit_cost=EXCLUDED.unit_cost,selling_price=EXCLUDED.selling_price,minimum_stock=EXCLUDED.minimum_stock,"
        "reorder_level=EXCLUDED.reorder_level,warranty_months=EXCLUDED.warranty_months;",
        p.id, p.name, p.category_id, p.unit_cost, p.selling_price, p.minimum_stock, p.reorder_level, static_cast<int64_t>(p.warranty_months));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SparePart> PgRepository::GetSparePart(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,name,category_id,unit_cost,selling_price,minimum_stock,reorder_level,warranty_months FROM spare_part WHERE id=$1;", id);
  return First<model::SparePart>(res, [](const pqxx::row& row) {
    model::SparePart p;
    p.id              = Text(row[0]);
    p.name            = Text(row[1]);
    p.category_id     = Text(row[2]);
    p.unit_cost       = row[3].as<int64_t>();
    p.selling_price   = row[4].as<int64_t>();
    p.minimum_stock   = row[5].as<int64_t>();
    p.reorder_level   = row[6].as<int64_t>();
    p.warranty_months = row[7].as<uint32_t>();
    return p;
  });
}

Result PgRepository::UpsertServiceRequest(Transaction& t, const model::ServiceRequest& s) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO service_request(id,store_id,technician_id,labor_hours) VALUES($1,$2,$3,$4) ON CONFLICT(id) DO UPDATE SET "
        "store_id=EXCLUDED.store_id,technician_id=EXCLUDED.technician_id,labor_hours=EXCLUDED.labor_hours;",
        s.id, s.store_id, s.technician_id, s.labor_hours);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ServiceRequest> PgRepository::GetServiceRequest(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params("SELECT id,store_id,technician_id,labor_hours FROM service_request WHERE id=$1;", id);
  return First<model::ServiceRequest>(res, [](const pqxx::row& row) {
    model::ServiceRequest s;
    s.id            = Text(row[0]);
    s.store_id      = Text(row[1]);
    s.technician_id = Text(row[2]);
    s.labor_hours   = row[3].as<double>();
    return s;
  });
}

} // namespace outflow::db::postgres
