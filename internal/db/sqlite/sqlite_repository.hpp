#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace outflow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::ServiceCostBreakdown> SelectBreakdowns(Transaction& t, const std::string& service_request_id, bool latest_only);
};

} // namespace outflow::db::sqlite
