#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace outflow::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  std::string error;
  if (TryExec(sql, &error) != SQLITE_OK) {
    throw std::runtime_error(error);
  }
}

int SqliteDB::TryExec(const std::string& sql, std::string* error) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK && error != nullptr) {
    *error = err ? err : "sqlite exec failed";
  }
  sqlite3_free(err);
  return rc;
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // WAL enables concurrent readers from other processes while a writer holds the lock
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS spare_part (id TEXT PRIMARY KEY, name TEXT NOT NULL, category_id TEXT NOT NULL, unit_cost INTEGER NOT NULL, "
      "selling_price INTEGER NOT NULL, minimum_stock INTEGER NOT NULL, reorder_level INTEGER NOT NULL, warranty_months INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS service_request (id TEXT PRIMARY KEY, store_id TEXT NOT NULL, technician_id TEXT NOT NULL, labor_hours REAL NOT NULL);",

      "CREATE TABLE IF NOT EXISTS inventory_level (spare_part_id TEXT NOT NULL, store_id TEXT NOT NULL, current_stock INTEGER NOT NULL, "
      "reserved_stock INTEGER NOT NULL, damaged_stock INTEGER NOT NULL, version INTEGER NOT NULL, last_movement_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (spare_part_id, store_id), CHECK (reserved_stock >= 0 AND reserved_stock <= current_stock));",

      "CREATE TABLE IF NOT EXISTS stock_movement (sequence INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, spare_part_id TEXT NOT NULL, "
      "store_id TEXT NOT NULL, movement_type INTEGER NOT NULL, quantity INTEGER NOT NULL, previous_stock INTEGER NOT NULL, new_stock INTEGER NOT NULL, "
      "unit_cost INTEGER NOT NULL, reference_type TEXT NOT NULL, reference_id TEXT NOT NULL, reason TEXT NOT NULL, created_by TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS stock_movement_key ON stock_movement(spare_part_id, store_id, sequence);",

      "CREATE TABLE IF NOT EXISTS part_request (id TEXT PRIMARY KEY, service_request_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, store_id TEXT NOT NULL, "
      "technician_id TEXT NOT NULL, requested_quantity INTEGER NOT NULL, urgency INTEGER NOT NULL, justification TEXT NOT NULL, status INTEGER NOT NULL, "
      "approval_level INTEGER NOT NULL, achieved_level INTEGER NOT NULL, estimated_cost INTEGER NOT NULL, issued_quantity INTEGER NOT NULL, "
      "issue_unit_cost INTEGER NOT NULL, issued_cost INTEGER NOT NULL, installed_quantity INTEGER NOT NULL, returned_quantity INTEGER NOT NULL, "
      "stock_blocked INTEGER NOT NULL, note TEXT NOT NULL, approved_by TEXT NOT NULL, approved_at_ms INTEGER NOT NULL, issued_at_ms INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS part_request_service ON part_request(service_request_id);",
      "CREATE INDEX IF NOT EXISTS part_request_technician ON part_request(technician_id, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS stock_reservation (id TEXT PRIMARY KEY, request_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, "
      "store_id TEXT NOT NULL, reserved_quantity INTEGER NOT NULL, reserved_for TEXT NOT NULL, status INTEGER NOT NULL, release_reason TEXT NOT NULL, "
      "reserved_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS stock_reservation_one_active ON stock_reservation(request_id) WHERE status = 1;",

      "CREATE TABLE IF NOT EXISTS approval_history (id TEXT PRIMARY KEY, request_id TEXT NOT NULL, level INTEGER NOT NULL, approver_id TEXT NOT NULL, "
      "decision INTEGER NOT NULL, comments TEXT NOT NULL, request_value INTEGER NOT NULL, available_stock INTEGER NOT NULL, decided_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS approval_history_request ON approval_history(request_id);",

      "CREATE TABLE IF NOT EXISTS technician_limit (id TEXT PRIMARY KEY, technician_id TEXT NOT NULL, category_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, "
      "max_value_per_request INTEGER NOT NULL, max_quantity_per_request INTEGER NOT NULL, max_value_per_day INTEGER NOT NULL, "
      "max_value_per_month INTEGER NOT NULL, auto_approve_below INTEGER NOT NULL, requires_approval INTEGER NOT NULL, approver_level INTEGER NOT NULL, "
      "active INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS role_assignment (principal_id TEXT NOT NULL, role TEXT NOT NULL, approval_level INTEGER NOT NULL, granted_by TEXT NOT NULL, "
      "granted_at_ms INTEGER NOT NULL, PRIMARY KEY (principal_id, role));",

      "CREATE TABLE IF NOT EXISTS installed_part (id TEXT PRIMARY KEY, request_id TEXT NOT NULL, service_request_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, "
      "technician_id TEXT NOT NULL, store_id TEXT NOT NULL, quantity INTEGER NOT NULL, unit_cost INTEGER NOT NULL, total_cost INTEGER NOT NULL, "
      "selling_price INTEGER NOT NULL, total_revenue INTEGER NOT NULL, serial_number TEXT NOT NULL, batch_number TEXT NOT NULL, notes TEXT NOT NULL, "
      "replaced_part_id TEXT NOT NULL, warranty_months INTEGER NOT NULL, warranty_expires_at_ms INTEGER NOT NULL, installed_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS installed_part_service ON installed_part(service_request_id);",

      "CREATE TABLE IF NOT EXISTS cost_breakdown (id TEXT NOT NULL UNIQUE, service_request_id TEXT NOT NULL, version INTEGER NOT NULL, "
      "parts_cost INTEGER NOT NULL, parts_revenue INTEGER NOT NULL, parts_markup INTEGER NOT NULL, labor_hours REAL NOT NULL, "
      "labor_rate_per_hour INTEGER NOT NULL, labor_cost INTEGER NOT NULL, labor_markup INTEGER NOT NULL, labor_total INTEGER NOT NULL, "
      "labor_markup_percent REAL NOT NULL, overhead_percent REAL NOT NULL, overhead_cost INTEGER NOT NULL, subtotal INTEGER NOT NULL, "
      "tax_percent REAL NOT NULL, tax_amount INTEGER NOT NULL, grand_total INTEGER NOT NULL, total_revenue INTEGER NOT NULL, total_cost INTEGER NOT NULL, "
      "net_margin INTEGER NOT NULL, margin_percent REAL NOT NULL, calculated_at_ms INTEGER NOT NULL, PRIMARY KEY (service_request_id, version));",

      "CREATE TABLE IF NOT EXISTS cost_breakdown_line (breakdown_id TEXT NOT NULL REFERENCES cost_breakdown(id), line_no INTEGER NOT NULL, "
      "spare_part_id TEXT NOT NULL, quantity INTEGER NOT NULL, unit_cost INTEGER NOT NULL, total_cost INTEGER NOT NULL, selling_price INTEGER NOT NULL, "
      "total_revenue INTEGER NOT NULL, PRIMARY KEY (breakdown_id, line_no));"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace outflow::db::sqlite
