#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace outflow::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLevel(Transaction&, const model::InventoryLevel&) override;
  std::optional<model::InventoryLevel> GetLevel(Transaction&, const model::LevelKey&) override;
  Result UpdateLevel(Transaction&, model::InventoryLevel&) override;
  std::vector<model::InventoryLevel> ListLevels(Transaction&) override;

  Result AppendMovement(Transaction&, model::StockMovement&) override;
  std::vector<model::StockMovement> ListMovements(Transaction&, const model::LevelKey&) override;

  Result InsertRequest(Transaction&, const model::SparePartRequest&) override;
  std::optional<model::SparePartRequest> GetRequest(Transaction&, const std::string&) override;
  Result UpdateRequest(Transaction&, model::SparePartRequest&) override;
  std::vector<model::SparePartRequest> FindRequests(Transaction&, const model::RequestFilter&) override;

  Result InsertReservation(Transaction&, const model::StockReservation&) override;
  std::optional<model::StockReservation> GetReservation(Transaction&, const std::string&) override;
  std::optional<model::StockReservation> GetActiveReservation(Transaction&, const std::string&) override;
  Result UpdateReservation(Transaction&, const model::StockReservation&) override;
  std::vector<model::StockReservation> ListActiveReservations(Transaction&) override;

  Result InsertApproval(Transaction&, const model::ApprovalHistory&) override;
  std::vector<model::ApprovalHistory> ListApprovals(Transaction&, const std::string&) override;

  Result UpsertLimit(Transaction&, const model::TechnicianLimit&) override;
  std::vector<model::TechnicianLimit> ListLimits(Transaction&, const std::string&) override;

  Result UpsertRole(Transaction&, const model::RoleAssignment&) override;
  Result DeleteRole(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::RoleAssignment> ListRoles(Transaction&, const std::string&) override;

  Result InsertInstalledPart(Transaction&, const model::InstalledPart&) override;
  std::vector<model::InstalledPart> ListInstalledParts(Transaction&, const std::string&) override;

  Result InsertBreakdown(Transaction&, const model::ServiceCostBreakdown&) override;
  std::optional<model::ServiceCostBreakdown> GetLatestBreakdown(Transaction&, const std::string&) override;
  std::vector<model::ServiceCostBreakdown> ListBreakdowns(Transaction&, const std::string&) override;

  Result UpsertSparePart(Transaction&, const model::SparePart&) override;
  std::optional<model::SparePart> GetSparePart(Transaction&, const std::string&) override;
  Result UpsertServiceRequest(Transaction&, const model::ServiceRequest&) override;
  std::optional<model::ServiceRequest> GetServiceRequest(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<model::LevelKey, model::InventoryLevel> levels;
    std::vector<model::StockMovement> movements;

    std::unordered_map<std::string, model::SparePartRequest> requests;
    std::unordered_map<std::string, model::StockReservation> reservations;
    std::vector<model::ApprovalHistory> approvals;

    std::unordered_map<std::string, model::TechnicianLimit> limits;
    // principal_id -> role -> assignment
    std::unordered_map<std::string, std::map<std::string, model::RoleAssignment>> roles;

    std::vector<model::InstalledPart> installed_parts;
    // service_request_id -> versions in ascending order
    std::unordered_map<std::string, std::vector<model::ServiceCostBreakdown>> breakdowns;

    std::unordered_map<std::string, model::SparePart> spare_parts;
    std::unordered_map<std::string, model::ServiceRequest> service_requests;

    // row -> number of commits that wrote it; the conflict check for MemoryTransaction.
    std::unordered_map<std::string, uint64_t> row_stamps;
  };

  uint64_t NextMovementSequence();

  std::mutex mutex_;
  State committed_;
  // Drawn outside any snapshot, so sequences from rolled back transactions leave gaps.
  uint64_t next_movement_sequence_ = 1;
};

} // namespace outflow::db::memory
