#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace outflow::db::memory {

namespace {

bool Matches(const model::SparePartRequest& r, const model::RequestFilter& f) {
  if (f.service_request_id && r.service_request_id != *f.service_request_id) return false;
  if (f.spare_part_id && r.spare_part_id != *f.spare_part_id) return false;
  if (f.technician_id && r.technician_id != *f.technician_id) return false;
  if (f.status && r.status != *f.status) return false;
  if (f.created_since_ms && r.created_at_ms < *f.created_since_ms) return false;
  return true;
}

std::string LevelRow(const model::LevelKey& key) {
  return "level/" + key.ToString();
}

// Reservations are keyed by request so two active holds for one request collide.
std::string ReservationRow(const std::string& request_id) {
  return "reservation/" + request_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

uint64_t MemoryRepository::NextMovementSequence() {
  std::scoped_lock lock(mutex_);
  return next_movement_sequence_++;
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Inventory levels + movement ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLevel(Transaction& t, const model::InventoryLevel& level) {
  auto& tx = TX(t);
  if (tx.View().levels.contains(level.Key())) return Result::Err(ErrorCode::AlreadyExists, level.Key().ToString());
  tx.Write(LevelRow(level.Key()), [level](State& s) { s.levels[level.Key()] = level; });
  return Result::Ok();
}

std::optional<model::InventoryLevel> MemoryRepository::GetLevel(Transaction& t, const model::LevelKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.levels.find(key);
  if (it == s.levels.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateLevel(Transaction& t, model::InventoryLevel& level) {
  auto& tx = TX(t);
  auto  it = tx.View().levels.find(level.Key());
  if (it == tx.View().levels.end()) return Result::Err(ErrorCode::NotFound, level.Key().ToString());
  if (it->second.version != level.version) {
    return Result::Err(ErrorCode::Conflict, "inventory level version mismatch for " + level.Key().ToString());
  }
  level.version++;
  tx.Write(LevelRow(level.Key()), [level](State& s) { s.levels[level.Key()] = level; });
  return Result::Ok();
}

std::vector<model::InventoryLevel> MemoryRepository::ListLevels(Transaction& t) {
  std::vector<model::InventoryLevel> out;
  for (const auto& [_, level] : TX(t).View().levels)
    out.push_back(level);
  return out;
}

Result MemoryRepository::AppendMovement(Transaction& t, model::StockMovement& movement) {
  movement.sequence = NextMovementSequence();
  TX(t).Write({}, [movement](State& s) { s.movements.push_back(movement); });
  return Result::Ok();
}

std::vector<model::StockMovement> MemoryRepository::ListMovements(Transaction& t, const model::LevelKey& key) {
  std::vector<model::StockMovement> out;
  for (const auto& m : TX(t).View().movements)
    if (m.spare_part_id == key.spare_part_id && m.store_id == key.store_id) out.push_back(m);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return out;
}

// ------------------------------------------------------------------
// Requests + reservations
// ------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, const model::SparePartRequest& r) {
  auto& tx = TX(t);
  if (tx.View().requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  tx.Write("request/" + r.id, [r](State& s) { s.requests[r.id] = r; });
  return Result::Ok();
}

std::optional<model::SparePartRequest> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRequest(Transaction& t, model::SparePartRequest& r) {
  auto& tx = TX(t);
  auto  it = tx.View().requests.find(r.id);
  if (it == tx.View().requests.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != r.version) return Result::Err(ErrorCode::Conflict, "request version mismatch for " + r.id);
  r.version++;
  tx.Write("request/" + r.id, [r](State& s) { s.requests[r.id] = r; });
  return Result::Ok();
}

std::vector<model::SparePartRequest> MemoryRepository::FindRequests(Transaction& t, const model::RequestFilter& filter) {
  std::vector<model::SparePartRequest> out;
  for (const auto& [_, r] : TX(t).View().requests)
    if (Matches(r, filter)) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

Result MemoryRepository::InsertReservation(Transaction& t, const model::StockReservation& r) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (s.reservations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  if (r.status == model::ReservationStatus::kActive) {
    for (const auto& [_, existing] : s.reservations) {
      if (existing.request_id == r.request_id && existing.status == model::ReservationStatus::kActive) {
        return Result::Err(ErrorCode::ConstraintViolation, "active reservation exists for request " + r.request_id);
      }
    }
  }
  tx.Write(ReservationRow(r.request_id), [r](State& state) { state.reservations[r.id] = r; });
  return Result::Ok();
}

std::optional<model::StockReservation> MemoryRepository::GetReservation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.reservations.find(id);
  if (it == s.reservations.end()) return std::nullopt;
  return it->second;
}

std::optional<model::StockReservation> MemoryRepository::GetActiveReservation(Transaction& t, const std::string& request_id) {
  for (const auto& [_, r] : TX(t).View().reservations)
    if (r.request_id == request_id && r.status == model::ReservationStatus::kActive) return r;
  return std::nullopt;
}

Result MemoryRepository::UpdateReservation(Transaction& t, const model::StockReservation& r) {
  auto& tx = TX(t);
  if (!tx.View().reservations.contains(r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  tx.Write(ReservationRow(r.request_id), [r](State& s) { s.reservations[r.id] = r; });
  return Result::Ok();
}

std::vector<model::StockReservation> MemoryRepository::ListActiveReservations(Transaction& t) {
  std::vector<model::StockReservation> out;
  for (const auto& [_, r] : TX(t).View().reservations)
    if (r.status == model::ReservationStatus::kActive) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.expires_at_ms < b.expires_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Approval trail, limits, roles
// ------------------------------------------------------------------

Result MemoryRepository::InsertApproval(Transaction& t, const model::ApprovalHistory& h) {
  TX(t).Write({}, [h](State& s) { s.approvals.push_back(h); });
  return Result::Ok();
}

std::vector<model::ApprovalHistory> MemoryRepository::ListApprovals(Transaction& t, const std::string& request_id) {
  std::vector<model::ApprovalHistory> out;
  for (const auto& h : TX(t).View().approvals)
    if (h.request_id == request_id) out.push_back(h);
  return out;
}

Result MemoryRepository::UpsertLimit(Transaction& t, const model::TechnicianLimit& limit) {
  TX(t).Write("limit/" + limit.id, [limit](State& s) { s.limits[limit.id] = limit; });
  return Result::Ok();
}

std::vector<model::TechnicianLimit> MemoryRepository::ListLimits(Transaction& t, const std::string& technician_id) {
  std::vector<model::TechnicianLimit> out;
  for (const auto& [_, limit] : TX(t).View().limits)
    if (limit.technician_id == technician_id) out.push_back(limit);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::UpsertRole(Transaction& t, const model::RoleAssignment& role) {
  TX(t).Write("roles/" + role.principal_id, [role](State& s) { s.roles[role.principal_id][role.role] = role; });
  return Result::Ok();
}

Result MemoryRepository::DeleteRole(Transaction& t, const std::string& principal_id, const std::string& role) {
  auto& tx = TX(t);
  auto  it = tx.View().roles.find(principal_id);
  if (it == tx.View().roles.end() || !it->second.contains(role)) return Result::Err(ErrorCode::NotFound, principal_id + "/" + role);
  tx.Write("roles/" + principal_id, [principal_id, role](State& s) { s.roles[principal_id].erase(role); });
  return Result::Ok();
}

std::vector<model::RoleAssignment> MemoryRepository::ListRoles(Transaction& t, const std::string& principal_id) {
  std::vector<model::RoleAssignment> out;
  const auto&                        s  = TX(t).View();
  auto                               it = s.roles.find(principal_id);
  if (it == s.roles.end()) return out;
  for (const auto& [_, role] : it->second)
    out.push_back(role);
  return out;
}

// ------------------------------------------------------------------
// Installations + settlements
// ------------------------------------------------------------------

Result MemoryRepository::InsertInstalledPart(Transaction& t, const model::InstalledPart& part) {
  auto& tx = TX(t);
  for (const auto& existing : tx.View().installed_parts)
    if (existing.id == part.id) return Result::Err(ErrorCode::AlreadyExists, part.id);
  tx.Write("installed/" + part.id, [part](State& s) { s.installed_parts.push_back(part); });
  return Result::Ok();
}

std::vector<model::InstalledPart> MemoryRepository::ListInstalledParts(Transaction& t, const std::string& service_request_id) {
  std::vector<model::InstalledPart> out;
  for (const auto& part : TX(t).View().installed_parts)
    if (part.service_request_id == service_request_id) out.push_back(part);
  return out;
}

Result MemoryRepository::InsertBreakdown(Transaction& t, const model::ServiceCostBreakdown& b) {
  auto& tx = TX(t);
  auto  it = tx.View().breakdowns.find(b.service_request_id);
  if (it != tx.View().breakdowns.end() && !it->second.empty() && it->second.back().version >= b.version) {
    return Result::Err(ErrorCode::AlreadyExists, b.service_request_id + " v" + std::to_string(b.version));
  }
  tx.Write("breakdown/" + b.service_request_id, [b](State& s) { s.breakdowns[b.service_request_id].push_back(b); });
  return Result::Ok();
}

std::optional<model::ServiceCostBreakdown> MemoryRepository::GetLatestBreakdown(Transaction& t, const std::string& service_request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.breakdowns.find(service_request_id);
  if (it == s.breakdowns.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

std::vector<model::ServiceCostBreakdown> MemoryRepository::ListBreakdowns(Transaction& t, const std::string& service_request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.breakdowns.find(service_request_id);
  if (it == s.breakdowns.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSparePart(Transaction& t, const model::SparePart& part) {
  TX(t).Write("part/" + part.id, [part](State& s) { s.spare_parts[part.id] = part; });
  return Result::Ok();
}

std::optional<model::SparePart> MemoryRepository::GetSparePart(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.spare_parts.find(id);
  if (it == s.spare_parts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertServiceRequest(Transaction& t, const model::ServiceRequest& service) {
  TX(t).Write("service/" + service.id, [service](State& s) { s.service_requests[service.id] = service; });
  return Result::Ok();
}

std::optional<model::ServiceRequest> MemoryRepository::GetServiceRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.service_requests.find(id);
  if (it == s.service_requests.end()) return std::nullopt;
  return it->second;
}

} // namespace outflow::db::memory
