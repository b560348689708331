#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <variant>

#include "internal/util/errors.hpp"

namespace outflow::db::sqlite {

using outflow::db::ErrorCode;
using outflow::db::Result;

namespace {

// Finalizes on scope exit; prepare failures are schema bugs and throw.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = std::string("sqlite prepare: ") + sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw std::runtime_error(msg);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

using Param = std::variant<int64_t, std::string>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindParams(sqlite3_stmt* st, const std::vector<Param>& params) {
  for (size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i + 1);
    if (const auto* text = std::get_if<std::string>(&params[i])) {
      BindText(st, idx, *text);
    } else {
      BindI64(st, idx, std::get<int64_t>(params[i]));
    }
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
  return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

// Rows are read until SQLITE_DONE; anything else is a backend failure.
template <typename T, typename ReadFn>
std::vector<T> CollectRows(sqlite3* db, Statement& stmt, ReadFn read) {
  std::vector<T> out;
  for (;;) {
    const int rc = stmt.Step();
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    out.push_back(read(stmt.get()));
  }
  return out;
}

template <typename T, typename ReadFn>
std::optional<T> FirstRow(sqlite3* db, Statement& stmt, ReadFn read) {
  const int rc = stmt.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return read(stmt.get());
}

// ------------------------------------------------------------------
// Row mappings. Column order matches the *_COLUMNS lists below.
// ------------------------------------------------------------------

constexpr const char* kLevelColumns = "spare_part_id,store_id,current_stock,reserved_stock,damaged_stock,version,last_movement_at_ms";

void BindLevel(sqlite3_stmt* st, const model::InventoryLevel& l) {
  BindText(st, 1, l.spare_part_id);
  BindText(st, 2, l.store_id);
  BindI64(st, 3, l.current_stock);
  BindI64(st, 4, l.reserved_stock);
  BindI64(st, 5, l.damaged_stock);
  BindU64(st, 6, l.version);
  BindU64(st, 7, l.last_movement_at_ms);
}

model::InventoryLevel ReadLevel(sqlite3_stmt* st) {
  model::InventoryLevel l;
  l.spare_part_id       = ColText(st, 0);
  l.store_id            = ColText(st, 1);
  l.current_stock       = ColI64(st, 2);
  l.reserved_stock      = ColI64(st, 3);
  l.damaged_stock       = ColI64(st, 4);
  l.version             = ColU64(st, 5);
  l.last_movement_at_ms = ColU64(st, 6);
  return l;
}

constexpr const char* kMovementColumns =
    "sequence,id,spare_part_id,store_id,movement_type,quantity,previous_stock,new_stock,unit_cost,reference_type,reference_id,reason,created_by,"
    "created_at_ms";

model::StockMovement ReadMovement(sqlite3_stmt* st) {
  model::StockMovement m;
  m.sequence       = ColU64(st, 0);
  m.id             = ColText(st, 1);
  m.spare_part_id  = ColText(st, 2);
  m.store_id       = ColText(st, 3);
  m.movement_type  = static_cast<model::MovementType>(ColI64(st, 4));
  m.quantity       = ColI64(st, 5);
  m.previous_stock = ColI64(st, 6);
  m.new_stock      = ColI64(st, 7);
  m.unit_cost      = ColI64(st, 8);
  m.reference_type = ColText(st, 9);
  m.reference_id   = ColText(st, 10);
  m.reason         = ColText(st, 11);
  m.created_by     = ColText(st, 12);
  m.created_at_ms  = ColU64(st, 13);
  return m;
}

constexpr const char* kRequestColumns =
    "id,service_request_id,spare_part_id,store_id,technician_id,requested_quantity,urgency,justification,status,approval_level,achieved_level,"
    "estimated_cost,issued_quantity,issue_unit_cost,issued_cost,installed_quantity,returned_quantity,stock_blocked,note,approved_by,approved_at_ms,"
    "issued_at_ms,created_at_ms,updated_at_ms,version";

void BindRequest(sqlite3_stmt* st, const model::SparePartRequest& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.service_request_id);
  BindText(st, 3, r.spare_part_id);
  BindText(st, 4, r.store_id);
  BindText(st, 5, r.technician_id);
  BindI64(st, 6, r.requested_quantity);
  BindI64(st, 7, static_cast<int64_t>(r.urgency));
  BindText(st, 8, r.justification);
  BindI64(st, 9, static_cast<int64_t>(r.status));
  BindI64(st, 10, r.approval_level);
  BindI64(st, 11, r.achieved_level);
  BindI64(st, 12, r.estimated_cost);
  BindI64(st, 13, r.issued_quantity);
  BindI64(st, 14, r.issue_unit_cost);
  BindI64(st, 15, r.issued_cost);
  BindI64(st, 16, r.installed_quantity);
  BindI64(st, 17, r.returned_quantity);
  BindI64(st, 18, r.stock_blocked ? 1 : 0);
  BindText(st, 19, r.note);
  BindText(st, 20, r.approved_by);
  BindU64(st, 21, r.approved_at_ms);
  BindU64(st, 22, r.issued_at_ms);
  BindU64(st, 23, r.created_at_ms);
  BindU64(st, 24, r.updated_at_ms);
  BindU64(st, 25, r.version);
}

model::SparePartRequest ReadRequest(sqlite3_stmt* st) {
  model::SparePartRequest r;
  r.id                 = ColText(st, 0);
  r.service_request_id = ColText(st, 1);
  r.spare_part_id      = ColText(st, 2);
  r.store_id           = ColText(st, 3);
  r.technician_id      = ColText(st, 4);
  r.requested_quantity = ColI64(st, 5);
  r.urgency            = static_cast<model::Urgency>(ColI64(st, 6));
  r.justification      = ColText(st, 7);
  r.status             = static_cast<model::RequestStatus>(ColI64(st, 8));
  r.approval_level     = ColU32(st, 9);
  r.achieved_level     = ColU32(st, 10);
  r.estimated_cost     = ColI64(st, 11);
  r.issued_quantity    = ColI64(st, 12);
  r.issue_unit_cost    = ColI64(st, 13);
  r.issued_cost        = ColI64(st, 14);
  r.installed_quantity = ColI64(st, 15);
  r.returned_quantity  = ColI64(st, 16);
  r.stock_blocked      = ColBool(st, 17);
  r.note               = ColText(st, 18);
  r.approved_by        = ColText(st, 19);
  r.approved_at_ms     = ColU64(st, 20);
  r.issued_at_ms       = ColU64(st, 21);
  r.created_at_ms      = ColU64(st, 22);
  r.updated_at_ms      = ColU64(st, 23);
  r.version            = ColU64(st, 24);
  return r;
}

constexpr const char* kReservationColumns =
    "id,request_id,spare_part_id,store_id,reserved_quantity,reserved_for,status,release_reason,reserved_at_ms,expires_at_ms,updated_at_ms";

void BindReservation(sqlite3_stmt* st, const model::StockReservation& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.request_id);
  BindText(st, 3, r.spare_part_id);
  BindText(st, 4, r.store_id);
  BindI64(st, 5, r.reserved_quantity);
  BindText(st, 6, r.reserved_for);
  BindI64(st, 7, static_cast<int64_t>(r.status));
  BindText(st, 8, r.release_reason);
  BindU64(st, 9, r.reserved_at_ms);
  BindU64(st, 10, r.expires_at_ms);
  BindU64(st, 11, r.updated_at_ms);
}

model::StockReservation ReadReservation(sqlite3_stmt* st) {
  model::StockReservation r;
  r.id                = ColText(st, 0);
  r.request_id        = ColText(st, 1);
  r.spare_part_id     = ColText(st, 2);
  r.store_id          = ColText(st, 3);
  r.reserved_quantity = ColI64(st, 4);
  r.reserved_for      = ColText(st, 5);
  r.status            = static_cast<model::ReservationStatus>(ColI64(st, 6));
  r.release_reason    = ColText(st, 7);
  r.reserved_at_ms    = ColU64(st, 8);
  r.expires_at_ms     = ColU64(st, 9);
  r.updated_at_ms     = ColU64(st, 10);
  return r;
}

constexpr const char* kApprovalColumns = "id,request_id,level,approver_id,decision,comments,request_value,available_stock,decided_at_ms";

model::ApprovalHistory ReadApproval(sqlite3_stmt* st) {
  model::ApprovalHistory h;
  h.id              = ColText(st, 0);
  h.request_id      = ColText(st, 1);
  h.level           = ColU32(st, 2);
  h.approver_id     = ColText(st, 3);
  h.decision        = static_cast<model::Decision>(ColI64(st, 4));
  h.comments        = ColText(st, 5);
  h.request_value   = ColI64(st, 6);
  h.available_stock = ColI64(st, 7);
  h.decided_at_ms   = ColU64(st, 8);
  return h;
}

constexpr const char* kLimitColumns =
    "id,technician_id,category_id,spare_part_id,max_value_per_request,max_quantity_per_request,max_value_per_day,max_value_per_month,"
    "auto_approve_below,requires_approval,approver_level,active";

model::TechnicianLimit ReadLimit(sqlite3_stmt* st) {
  model::TechnicianLimit l;
  l.id                       = ColText(st, 0);
  l.technician_id            = ColText(st, 1);
  l.category_id              = ColText(st, 2);
  l.spare_part_id            = ColText(st, 3);
  l.max_value_per_request    = ColI64(st, 4);
  l.max_quantity_per_request = ColI64(st, 5);
  l.max_value_per_day        = ColI64(st, 6);
  l.max_value_per_month      = ColI64(st, 7);
  l.auto_approve_below       = ColI64(st, 8);
  l.requires_approval        = ColBool(st, 9);
  l.approver_level           = ColU32(st, 10);
  l.active                   = ColBool(st, 11);
  return l;
}

constexpr const char* kInstalledColumns =
    "id,request_id,service_request_id,spare_part_id,technician_id,store_id,quantity,unit_cost,total_cost,selling_price,total_revenue,"
    "serial_number,batch_number,notes,replaced_part_id,warranty_months,warranty_expires_at_ms,installed_at_ms";

model::InstalledPart ReadInstalled(sqlite3_stmt* st) {
  model::InstalledPart p;
  p.id                     = ColText(st, 0);
  p.request_id             = ColText(st, 1);
  p.service_request_id     = ColText(st, 2);
  p.spare_part_id          = ColText(st, 3);
  p.technician_id          = ColText(st, 4);
  p.store_id               = ColText(st, 5);
  p.quantity               = ColI64(st, 6);
  p.unit_cost              = ColI64(st, 7);
  p.total_cost             = ColI64(st, 8);
  p.selling_price          = ColI64(st, 9);
  p.total_revenue          = ColI64(st, 10);
  p.serial_number          = ColText(st, 11);
  p.batch_number           = ColText(st, 12);
  p.notes                  = ColText(st, 13);
  p.replaced_part_id       = ColText(st, 14);
  p.warranty_months        = ColU32(st, 15);
  p.warranty_expires_at_ms = ColU64(st, 16);
  p.installed_at_ms        = ColU64(st, 17);
  return p;
}

constexpr const char* kBreakdownColumns =
    "id,service_request_id,version,parts_cost,parts_revenue,parts_markup,labor_hours,labor_rate_per_hour,labor_cost,labor_markup,labor_total,"
    "labor_markup_percent,overhead_percent,overhead_cost,subtotal,tax_percent,tax_amount,grand_total,total_revenue,total_cost,net_margin,"
    "margin_percent,calculated_at_ms";

model::ServiceCostBreakdown ReadBreakdown(sqlite3_stmt* st) {
  model::ServiceCostBreakdown b;
  b.id                   = ColText(st, 0);
  b.service_request_id   = ColText(st, 1);
  b.version              = ColU32(st, 2);
  b.parts_cost           = ColI64(st, 3);
  b.parts_revenue        = ColI64(st, 4);
  b.parts_markup         = ColI64(st, 5);
  b.labor_hours          = ColDouble(st, 6);
  b.labor_rate_per_hour  = ColI64(st, 7);
  b.labor_cost           = ColI64(st, 8);
  b.labor_markup         = ColI64(st, 9);
  b.labor_total          = ColI64(st, 10);
  b.labor_markup_percent = ColDouble(st, 11);
  b.overhead_percent     = ColDouble(st, 12);
  b.overhead_cost        = ColI64(st, 13);
  b.subtotal             = ColI64(st, 14);
  b.tax_percent          = ColDouble(st, 15);
  b.tax_amount           = ColI64(st, 16);
  b.grand_total          = ColI64(st, 17);
  b.total_revenue        = ColI64(st, 18);
  b.total_cost           = ColI64(st, 19);
  b.net_margin           = ColI64(st, 20);
  b.margin_percent       = ColDouble(st, 21);
  b.calculated_at_ms     = ColU64(st, 22);
  return b;
}

std::string Sql(std::initializer_list<std::string> parts) {
  std::string out;
  for (const auto& p : parts)
    out += p;
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

// A writer that cannot get the connection within the busy timeout lost a race
// like any other, so callers see it as StaleState and retry.
std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  try {
    return std::make_unique<SqliteTransaction>(db_);
  } catch (const SerializationError& e) {
    throw util::StaleState(std::string("sqlite begin: ") + e.what());
  }
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Inventory levels + movement ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLevel(Transaction& t, const model::InventoryLevel& l) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"INSERT INTO inventory_level(", kLevelColumns, ") VALUES(?1,?2,?3,?4,?5,?6,?7);"}));
  BindLevel(st.get(), l);
  return Translate(db, st.Step());
}

std::optional<model::InventoryLevel> SqliteRepository::GetLevel(Transaction& t, const model::LevelKey& key) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kLevelColumns, " FROM inventory_level WHERE spare_part_id=?1 AND store_id=?2;"}));
  BindText(st.get(), 1, key.spare_part_id);
  BindText(st.get(), 2, key.store_id);
  return FirstRow<model::InventoryLevel>(db, st, ReadLevel);
}

Result SqliteRepository::UpdateLevel(Transaction& t, model::InventoryLevel& l) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE inventory_level SET current_stock=?3,reserved_stock=?4,damaged_stock=?5,version=?6+1,last_movement_at_ms=?7 "
               "WHERE spare_part_id=?1 AND store_id=?2 AND version=?6;");
  BindLevel(st.get(), l);
  auto result = Translate(db, st.Step());
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    if (!GetLevel(t, l.Key())) return Result::Err(ErrorCode::NotFound, l.Key().ToString());
    return Result::Err(ErrorCode::Conflict, "inventory level version mismatch for " + l.Key().ToString());
  }
  l.version++;
  return Result::Ok();
}

std::vector<model::InventoryLevel> SqliteRepository::ListLevels(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kLevelColumns, " FROM inventory_level ORDER BY spare_part_id, store_id;"}));
  return CollectRows<model::InventoryLevel>(db, st, ReadLevel);
}

Result SqliteRepository::AppendMovement(Transaction& t, model::StockMovement& m) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO stock_movement(id,spare_part_id,store_id,movement_type,quantity,previous_stock,new_stock,unit_cost,reference_type,"
               "reference_id,reason,created_by,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, m.id);
  BindText(st.get(), 2, m.spare_part_id);
  BindText(st.get(), 3, m.store_id);
  BindI64(st.get(), 4, static_cast<int64_t>(m.movement_type));
  BindI64(st.get(), 5, m.quantity);
  BindI64(st.get(), 6, m.previous_stock);
  BindI64(st.get(), 7, m.new_stock);
  BindI64(st.get(), 8, m.unit_cost);
  BindText(st.get(), 9, m.reference_type);
  BindText(st.get(), 10, m.reference_id);
  BindText(st.get(), 11, m.reason);
  BindText(st.get(), 12, m.created_by);
  BindU64(st.get(), 13, m.created_at_ms);

  auto result = Translate(db, st.Step());
  if (result) m.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::StockMovement> SqliteRepository::ListMovements(Transaction& t, const model::LevelKey& key) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kMovementColumns, " FROM stock_movement WHERE spare_part_id=?1 AND store_id=?2 ORDER BY sequence;"}));
  BindText(st.get(), 1, key.spare_part_id);
  BindText(st.get(), 2, key.store_id);
  return CollectRows<model::StockMovement>(db, st, ReadMovement);
}

// ------------------------------------------------------------------
// Requests + reservations
// ------------------------------------------------------------------

Result SqliteRepository::InsertRequest(Transaction& t, const model::SparePartRequest& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"INSERT INTO part_request(", kRequestColumns,
                        ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20,?21,?22,?23,?24,?25);"}));
  BindRequest(st.get(), r);
  return Translate(db, st.Step());
}

std::optional<model::SparePartRequest> SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kRequestColumns, " FROM part_request WHERE id=?1;"}));
  BindText(st.get(), 1, id);
  return FirstRow<model::SparePartRequest>(db, st, ReadRequest);
}

Result SqliteRepository::UpdateRequest(Transaction& t, model::SparePartRequest& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE part_request SET service_request_id=?2,spare_part_id=?3,store_id=?4,technician_id=?5,requested_quantity=?6,urgency=?7,"
               "justification=?8,status=?9,approval_level=?10,achieved_level=?11,estimated_cost=?12,issued_quantity=?13,issue_unit_cost=?14,"
               "issued_cost=?15,installed_quantity=?16,returned_quantity=?17,stock_blocked=?18,note=?19,approved_by=?20,approved_at_ms=?21,"
               "issued_at_ms=?22,created_at_ms=?23,updated_at_ms=?24,version=?25+1 WHERE id=?1 AND version=?25;");
  BindRequest(st.get(), r);
  auto result = Translate(db, st.Step());
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    if (!GetRequest(t, r.id)) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Err(ErrorCode::Conflict, "request version mismatch for " + r.id);
  }
  r.version++;
  return Result::Ok();
}

std::vector<model::SparePartRequest> SqliteRepository::FindRequests(Transaction& t, const model::RequestFilter& f) {
  std::string        sql = Sql({"SELECT ", kRequestColumns, " FROM part_request WHERE 1=1"});
  std::vector<Param> params;
  if (f.service_request_id) {
    sql += " AND service_request_id=?";
    params.emplace_back(*f.service_request_id);
  }
  if (f.spare_part_id) {
    sql += " AND spare_part_id=?";
    params.emplace_back(*f.spare_part_id);
  }
  if (f.technician_id) {
    sql += " AND technician_id=?";
    params.emplace_back(*f.technician_id);
  }
  if (f.status) {
    sql += " AND status=?";
    params.emplace_back(static_cast<int64_t>(*f.status));
  }
  if (f.created_since_ms) {
    sql += " AND created_at_ms>=?";
    params.emplace_back(static_cast<int64_t>(*f.created_since_ms));
  }
  sql += " ORDER BY created_at_ms, id;";

  auto*     db = TX(t).Handle();
  Statement st(db, sql);
  BindParams(st.get(), params);
  return CollectRows<model::SparePartRequest>(db, st, ReadRequest);
}

Result SqliteRepository::InsertReservation(Transaction& t, const model::StockReservation& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"INSERT INTO stock_reservation(", kReservationColumns, ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11);"}));
  BindReservation(st.get(), r);
  return Translate(db, st.Step());
}

std::optional<model::StockReservation> SqliteRepository::GetReservation(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kReservationColumns, " FROM stock_reservation WHERE id=?1;"}));
  BindText(st.get(), 1, id);
  return FirstRow<model::StockReservation>(db, st, ReadReservation);
}

std::optional<model::StockReservation> SqliteRepository::GetActiveReservation(Transaction& t, const std::string& request_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kReservationColumns, " FROM stock_reservation WHERE request_id=?1 AND status=?2;"}));
  BindText(st.get(), 1, request_id);
  BindI64(st.get(), 2, static_cast<int64_t>(model::ReservationStatus::kActive));
  return FirstRow<model::StockReservation>(db, st, ReadReservation);
}

Result SqliteRepository::UpdateReservation(Transaction& t, const model::StockReservation& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE stock_reservation SET request_id=?2,spare_part_id=?3,store_id=?4,reserved_quantity=?5,reserved_for=?6,status=?7,"
               "release_reason=?8,reserved_at_ms=?9,expires_at_ms=?10,updated_at_ms=?11 WHERE id=?1;");
  BindReservation(st.get(), r);
  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return result;
}

std::vector<model::StockReservation> SqliteRepository::ListActiveReservations(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kReservationColumns, " FROM stock_reservation WHERE status=?1 ORDER BY expires_at_ms;"}));
  BindI64(st.get(), 1, static_cast<int64_t>(model::ReservationStatus::kActive));
  return CollectRows<model::StockReservation>(db, st, ReadReservation);
}

// ------------------------------------------------------------------
// Approval trail, limits, roles
// ------------------------------------------------------------------

Result SqliteRepository::InsertApproval(Transaction& t, const model::ApprovalHistory& h) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"INSERT INTO approval_history(", kApprovalColumns, ") VALUES(?,?,?,?,?,?,?,?,?);"}));
  BindText(st.get(), 1, h.id);
  BindText(st.get(), 2, h.request_id);
  BindI64(st.get(), 3, h.level);
  BindText(st.get(), 4, h.approver_id);
  BindI64(st.get(), 5, static_cast<int64_t>(h.decision));
  BindText(st.get(), 6, h.comments);
  BindI64(st.get(), 7, h.request_value);
  BindI64(st.get(), 8, h.available_stock);
  BindU64(st.get(), 9, h.decided_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::ApprovalHistory> SqliteRepository::ListApprovals(Transaction& t, const std::string& request_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kApprovalColumns, " FROM approval_history WHERE request_id=?1 ORDER BY rowid;"}));
  BindText(st.get(), 1, request_id);
  return CollectRows<model::ApprovalHistory>(db, st, ReadApproval);
}

Result SqliteRepository::UpsertLimit(Transaction& t, const model::TechnicianLimit& l) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"INSERT OR REPLACE INTO technician_limit(", kLimitColumns, ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);"}));
  BindText(st.get(), 1, l.id);
  BindText(st.get(), 2, l.technician_id);
  BindText(st.get(), 3, l.category_id);
  BindText(st.get(), 4, l.spare_part_id);
  BindI64(st.get(), 5, l.max_value_per_request);
  BindI64(st.get(), 6, l.max_quantity_per_request);
  BindI64(st.get(), 7, l.max_value_per_day);
  BindI64(st.get(), 8, l.max_value_per_month);
  BindI64(st.get(), 9, l.auto_approve_below);
  BindI64(st.get(), 10, l.requires_approval ? 1 : 0);
  BindI64(st.get(), 11, l.approver_level);
  BindI64(st.get(), 12, l.active ? 1 : 0);
  return Translate(db, st.Step());
}

std::vector<model::TechnicianLimit> SqliteRepository::ListLimits(Transaction& t, const std::string& technician_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kLimitColumns, " FROM technician_limit WHERE technician_id=?1 ORDER BY id;"}));
  BindText(st.get(), 1, technician_id);
  return CollectRows<model::TechnicianLimit>(db, st, ReadLimit);
}

Result SqliteRepository::UpsertRole(Transaction& t, const model::RoleAssignment& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO role_assignment(principal_id,role,approval_level,granted_by,granted_at_ms) VALUES(?,?,?,?,?) "
               "ON CONFLICT(principal_id,role) DO UPDATE SET approval_level=excluded.approval_level,granted_by=excluded.granted_by,"
               "granted_at_ms=excluded.granted_at_ms;");
  BindText(st.get(), 1, r.principal_id);
  BindText(st.get(), 2, r.role);
  BindI64(st.get(), 3, r.approval_level);
  BindText(st.get(), 4, r.granted_by);
  BindU64(st.get(), 5, r.granted_at_ms);
  return Translate(db, st.Step());
}

Result SqliteRepository::DeleteRole(Transaction& t, const std::string& principal_id, const std::string& role) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM role_assignment WHERE principal_id=?1 AND role=?2;");
  BindText(st.get(), 1, principal_id);
  BindText(st.get(), 2, role);
  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, principal_id + "/" + role);
  return result;
}

std::vector<model::RoleAssignment> SqliteRepository::ListRoles(Transaction& t, const std::string& principal_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT principal_id,role,approval_level,granted_by,granted_at_ms FROM role_assignment WHERE principal_id=?1 ORDER BY role;");
  BindText(st.get(), 1, principal_id);
  return CollectRows<model::RoleAssignment>(db, st, [](sqlite3_stmt* row) {
    model::RoleAssignment r;
    r.principal_id   = ColText(row, 0);
    r.role           = ColText(row, 1);
    r.approval_level = ColU32(row, 2);
    r.granted_by     = ColText(row, 3);
    r.granted_at_ms  = ColU64(row, 4);
    return r;
  });
}

// ------------------------------------------------------------------
// Installations + settlements
// ------------------------------------------------------------------

Result SqliteRepository::InsertInstalledPart(Transaction& t, const model::InstalledPart& p) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"INSERT INTO installed_part(", kInstalledColumns, ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);"}));
  BindText(st.get(), 1, p.id);
  BindText(st.get(), 2, p.request_id);
  BindText(st.get(), 3, p.service_request_id);
  BindText(st.get(), 4, p.spare_part_id);
  BindText(st.get(), 5, p.technician_id);
  BindText(st.get(), 6, p.store_id);
  BindI64(st.get(), 7, p.quantity);
  BindI64(st.get(), 8, p.unit_cost);
  BindI64(st.get(), 9, p.total_cost);
  BindI64(st.get(), 10, p.selling_price);
  BindI64(st.get(), 11, p.total_revenue);
  BindText(st.get(), 12, p.serial_number);
  BindText(st.get(), 13, p.batch_number);
  BindText(st.get(), 14, p.notes);
  BindText(st.get(), 15, p.replaced_part_id);
  BindI64(st.get(), 16, p.warranty_months);
  BindU64(st.get(), 17, p.warranty_expires_at_ms);
  BindU64(st.get(), 18, p.installed_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::InstalledPart> SqliteRepository::ListInstalledParts(Transaction& t, const std::string& service_request_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kInstalledColumns, " FROM installed_part WHERE service_request_id=?1 ORDER BY rowid;"}));
  BindText(st.get(), 1, service_request_id);
  return CollectRows<model::InstalledPart>(db, st, ReadInstalled);
}

Result SqliteRepository::InsertBreakdown(Transaction& t, const model::ServiceCostBreakdown& b) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, Sql({"INSERT INTO cost_breakdown(", kBreakdownColumns, ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);"}));
    BindText(st.get(), 1, b.id);
    BindText(st.get(), 2, b.service_request_id);
    BindI64(st.get(), 3, b.version);
    BindI64(st.get(), 4, b.parts_cost);
    BindI64(st.get(), 5, b.parts_revenue);
    BindI64(st.get(), 6, b.parts_markup);
    BindDouble(st.get(), 7, b.labor_hours);
    BindI64(st.get(), 8, b.labor_rate_per_hour);
    BindI64(st.get(), 9, b.labor_cost);
    BindI64(st.get(), 10, b.labor_markup);
    BindI64(st.get(), 11, b.labor_total);
    BindDouble(st.get(), 12, b.labor_markup_percent);
    BindDouble(st.get(), 13, b.overhead_percent);
    BindI64(st.get(), 14, b.overhead_cost);
    BindI64(st.get(), 15, b.subtotal);
    BindDouble(st.get(), 16, b.tax_percent);
    BindI64(st.get(), 17, b.tax_amount);
    BindI64(st.get(), 18, b.grand_total);
    BindI64(st.get(), 19, b.total_revenue);
    BindI64(st.get(), 20, b.total_cost);
    BindI64(st.get(), 21, b.net_margin);
    BindDouble(st.get(), 22, b.margin_percent);
    BindU64(st.get(), 23, b.calculated_at_ms);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }

  for (size_t i = 0; i < b.lines.size(); ++i) {
    const auto& line = b.lines[i];
    Statement   st(db,
                   "INSERT INTO cost_breakdown_line(breakdown_id,line_no,spare_part_id,quantity,unit_cost,total_cost,selling_price,total_revenue) "
                   "VALUES(?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, b.id);
    BindI64(st.get(), 2, static_cast<int64_t>(i));
    BindText(st.get(), 3, line.spare_part_id);
    BindI64(st.get(), 4, line.quantity);
    BindI64(st.get(), 5, line.unit_cost);
    BindI64(st.get(), 6, line.total_cost);
    BindI64(st.get(), 7, line.selling_price);
    BindI64(st.get(), 8, line.total_revenue);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::ServiceCostBreakdown> SqliteRepository::SelectBreakdowns(Transaction& t, const std::string& service_request_id, bool latest_only) {
  auto*     db = TX(t).Handle();
  Statement st(db, Sql({"SELECT ", kBreakdownColumns, " FROM cost_breakdown WHERE service_request_id=?1 ORDER BY version",
                        latest_only ? " DESC LIMIT 1;" : ";"}));
  BindText(st.get(), 1, service_request_id);
  auto breakdowns = CollectRows<model::ServiceCostBreakdown>(db, st, ReadBreakdown);

  for (auto& b : breakdowns) {
    Statement lines(db,
                    "SELECT spare_part_id,quantity,unit_cost,total_cost,selling_price,total_revenue FROM cost_breakdown_line "
                    "WHERE breakdown_id=?1 ORDER BY line_no;");
    BindText(lines.get(), 1, b.id);
    b.lines = CollectRows<model::CostLine>(db, lines, [](sqlite3_stmt* row) {
      model::CostLine line;
      line.spare_part_id = ColText(row, 0);
      line.quantity      = ColI64(row, 1);
      line.unit_cost     = ColI64(row, 2);
      line.total_cost    = ColI64(row, 3);
      line.selling_price = ColI64(row, 4);
      line.total_revenue = ColI64(row, 5);
      return line;
    });
  }
  return breakdowns;
}

std::optional<model::ServiceCostBreakdown> SqliteRepository::GetLatestBreakdown(Transaction& t, const std::string& service_request_id) {
  auto breakdowns = SelectBreakdowns(t, service_request_id, true);
  if (breakdowns.empty()) return std::nullopt;
  return breakdowns.front();
}

std::vector<model::ServiceCostBreakdown> SqliteRepository::ListBreakdowns(Transaction& t, const std::string& service_request_id) {
  return SelectBreakdowns(t, service_request_id, false);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSparePart(Transaction& t, const model::SparePart& p) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT OR REPLACE INTO spare_part(id,name,category_id,unit_cost,selling_price,minimum_stock,reorder_level,warranty_months) "
               "VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, p.id);
  BindText(st.get(), 2, p.name);
  BindText(st.get(), 3, p.category_id);
  BindI64(st.get(), 4, p.unit_cost);
  BindI64(st.get(), 5, p.selling_price);
  BindI64(st.get(), 6, p.minimum_stock);
  BindI64(st.get(), 7, p.reorder_level);
  BindI64(st.get(), 8, p.warranty_months);
  return Translate(db, st.Step());
}

std::optional<model::SparePart> SqliteRepository::GetSparePart(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,name,category_id,unit_cost,selling_price,minimum_stock,reorder_level,warranty_months FROM spare_part WHERE id=?1;");
  BindText(st.get(), 1, id);
  return FirstRow<model::SparePart>(db, st, [](sqlite3_stmt* row) {
    model::SparePart p;
    p.id              = ColText(row, 0);
    p.name            = ColText(row, 1);
    p.category_id     = ColText(row, 2);
    p.unit_cost       = ColI64(row, 3);
    p.selling_price   = ColI64(row, 4);
    p.minimum_stock   = ColI64(row, 5);
    p.reorder_level   = ColI64(row, 6);
    p.warranty_months = ColU32(row, 7);
    return p;
  });
}

Result SqliteRepository::UpsertServiceRequest(Transaction& t, const model::ServiceRequest& s) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT OR REPLACE INTO service_request(id,store_id,technician_id,labor_hours) VALUES(?,?,?,?);");
  BindText(st.get(), 1, s.id);
  BindText(st.get(), 2, s.store_id);
  BindText(st.get(), 3, s.technician_id);
  BindDouble(st.get(), 4, s.labor_hours);
  return Translate(db, st.Step());
}

std::optional<model::ServiceRequest> SqliteRepository::GetServiceRequest(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,store_id,technician_id,labor_hours FROM service_request WHERE id=?1;");
  BindText(st.get(), 1, id);
  return FirstRow<model::ServiceRequest>(db, st, [](sqlite3_stmt* row) {
    model::ServiceRequest s;
    s.id            = ColText(row, 0);
    s.store_id      = ColText(row, 1);
    s.technician_id = ColText(row, 2);
    s.labor_hours   = ColDouble(row, 3);
    return s;
  });
}

} // namespace outflow::db::sqlite
