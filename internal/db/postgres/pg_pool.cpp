#include "pg_pool.hpp"

namespace outflow::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(new pqxx::connection(conninfo_));
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS spare_part (id TEXT PRIMARY KEY, name TEXT NOT NULL, category_id TEXT NOT NULL, unit_cost BIGINT NOT NULL, "
          "selling_price BIGINT NOT NULL, minimum_stock BIGINT NOT NULL, reorder_level BIGINT NOT NULL, warranty_months INTEGER NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS service_request (id TEXT PRIMARY KEY, store_id TEXT NOT NULL, technician_id TEXT NOT NULL, "
          "labor_hours DOUBLE PRECISION NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS inventory_level (spare_part_id TEXT NOT NULL, store_id TEXT NOT NULL, current_stock BIGINT NOT NULL, "
          "reserved_stock BIGINT NOT NULL, damaged_stock BIGINT NOT NULL, version BIGINT NOT NULL, last_movement_at_ms BIGINT NOT NULL, "
          "PRIMARY KEY (spare_part_id, store_id), CHECK (reserved_stock >= 0 AND reserved_stock <= current_stock));");
  tx.exec("CREATE TABLE IF NOT EXISTS stock_movement (sequence BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, spare_part_id TEXT NOT NULL, "
          "store_id TEXT NOT NULL, movement_type SMALLINT NOT NULL, quantity BIGINT NOT NULL, previous_stock BIGINT NOT NULL, "
          "new_stock BIGINT NOT NULL, unit_cost BIGINT NOT NULL, reference_type TEXT NOT NULL, reference_id TEXT NOT NULL, reason TEXT NOT NULL, "
          "created_by TEXT NOT NULL, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS stock_movement_key ON stock_movement(spare_part_id, store_id, sequence);");
  tx.exec("CREATE TABLE IF NOT EXISTS part_request (id TEXT PRIMARY KEY, service_request_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, "
          "store_id TEXT NOT NULL, technician_id TEXT NOT NULL, requested_quantity BIGINT NOT NULL, urgency SMALLINT NOT NULL, "
          "justification TEXT NOT NULL, status SMALLINT NOT NULL, approval_level INTEGER NOT NULL, achieved_level INTEGER NOT NULL, "
          "estimated_cost BIGINT NOT NULL, issued_quantity BIGINT NOT NULL, issue_unit_cost BIGINT NOT NULL, issued_cost BIGINT NOT NULL, "
          "installed_quantity BIGINT NOT NULL, returned_quantity BIGINT NOT NULL, stock_blocked BOOLEAN NOT NULL, note TEXT NOT NULL, "
          "approved_by TEXT NOT NULL, approved_at_ms BIGINT NOT NULL, issued_at_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, "
          "updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS part_request_service ON part_request(service_request_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS part_request_technician ON part_request(technician_id, created_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS stock_reservation (id TEXT PRIMARY KEY, request_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, "
          "store_id TEXT NOT NULL, reserved_quantity BIGINT NOT NULL, reserved_for TEXT NOT NULL, status SMALLINT NOT NULL, "
          "release_reason TEXT NOT NULL, reserved_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS stock_reservation_one_active ON stock_reservation(request_id) WHERE status = 1;");
  tx.exec("CREATE TABLE IF NOT EXISTS approval_history (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, request_id TEXT NOT NULL, "
          "level INTEGER NOT NULL, approver_id TEXT NOT NULL, decision SMALLINT NOT NULL, comments TEXT NOT NULL, request_value BIGINT NOT NULL, "
          "available_stock BIGINT NOT NULL, decided_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS approval_history_request ON approval_history(request_id, seq);");
  tx.exec("CREATE TABLE IF NOT EXISTS technician_limit (id TEXT PRIMARY KEY, technician_id TEXT NOT NULL, category_id TEXT NOT NULL, "
          "spare_part_id TEXT NOT NULL, max_value_per_request BIGINT NOT NULL, max_quantity_per_request BIGINT NOT NULL, "
          "max_value_per_day BIGINT NOT NULL, max_value_per_month BIGINT NOT NULL, auto_approve_below BIGINT NOT NULL, "
          "requires_approval BOOLEAN NOT NULL, approver_level INTEGER NOT NULL, active BOOLEAN NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS role_assignment (principal_id TEXT NOT NULL, role TEXT NOT NULL, approval_level INTEGER NOT NULL, "
          "granted_by TEXT NOT NULL, granted_at_ms BIGINT NOT NULL, PRIMARY KEY (principal_id, role));");
  tx.exec("CREATE TABLE IF NOT EXISTS installed_part (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, request_id TEXT NOT NULL, "
          "service_request_id TEXT NOT NULL, spare_part_id TEXT NOT NULL, technician_id TEXT NOT NULL, store_id TEXT NOT NULL, "
          "quantity BIGINT NOT NULL, unit_cost BIGINT NOT NULL, total_cost BIGINT NOT NULL, selling_price BIGINT NOT NULL, "
          "total_revenue BIGINT NOT NULL, serial_number TEXT NOT NULL, batch_number TEXT NOT NULL, notes TEXT NOT NULL, "
          "replaced_part_id TEXT NOT NULL, warranty_months INTEGER NOT NULL, warranty_expires_at_ms BIGINT NOT NULL, installed_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS installed_part_service ON installed_part(service_request_id, seq);");
  tx.exec("CREATE TABLE IF NOT EXISTS cost_breakdown (id TEXT NOT NULL UNIQUE, service_request_id TEXT NOT NULL, version INTEGER NOT NULL, "
          "parts_cost BIGINT NOT NULL, parts_revenue BIGINT NOT NULL, parts_markup BIGINT NOT NULL, labor_hours DOUBLE PRECISION NOT NULL, "
          "labor_rate_per_hour BIGINT NOT NULL, labor_cost BIGINT NOT NULL, labor_markup BIGINT NOT NULL, labor_total BIGINT NOT NULL, "
          "labor_markup_percent DOUBLE PRECISION NOT NULL, overhead_percent DOUBLE PRECISION NOT NULL, overhead_cost BIGINT NOT NULL, "
          "subtotal BIGINT NOT NULL, tax_percent DOUBLE PRECISION NOT NULL, tax_amount BIGINT NOT NULL, grand_total BIGINT NOT NULL, "
          "total_revenue BIGINT NOT NULL, total_cost BIGINT NOT NULL, net_margin BIGINT NOT NULL, margin_percent DOUBLE PRECISION NOT NULL, "
          "calculated_at_ms BIGINT NOT NULL, PRIMARY KEY (service_request_id, version));");
  tx.exec("CREATE TABLE IF NOT EXISTS cost_breakdown_line (breakdown_id TEXT NOT NULL REFERENCES cost_breakdown(id), line_no INTEGER NOT NULL, "
          "spare_part_id TEXT NOT NULL, quantity BIGINT NOT NULL, unit_cost BIGINT NOT NULL, total_cost BIGINT NOT NULL, "
          "selling_price BIGINT NOT NULL, total_revenue BIGINT NOT NULL, PRIMARY KEY (breakdown_id, line_no));");
  tx.commit();
}

} // namespace outflow::db::postgres
