#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/catalog.hpp"
#include "internal/model/cost_breakdown.hpp"
#include "internal/model/installed_part.hpp"

namespace outflow::db {

class InstallationRepository {
 public:
  virtual ~InstallationRepository() = default;

  virtual Result InsertInstalledPart(Transaction&, const model::InstalledPart&) = 0;

  // Oldest first.
  virtual std::vector<model::InstalledPart> ListInstalledParts(Transaction&, const std::string& service_request_id) = 0;
};

class CostRepository {
 public:
  virtual ~CostRepository() = default;

  // AlreadyExists when (service_request_id, version) is taken.
  virtual Result InsertBreakdown(Transaction&, const model::ServiceCostBreakdown&) = 0;

  virtual std::optional<model::ServiceCostBreakdown> GetLatestBreakdown(Transaction&, const std::string& service_request_id) = 0;

  // Ordered by version.
  virtual std::vector<model::ServiceCostBreakdown> ListBreakdowns(Transaction&, const std::string& service_request_id) = 0;
};

/*
  Collaborator records owned by other systems. The engine only reads them;
  the upserts exist so they can be seeded.
*/
class CatalogRepository {
 public:
  virtual ~CatalogRepository() = default;

  virtual Result UpsertSparePart(Transaction&, const model::SparePart&) = 0;

  virtual std::optional<model::SparePart> GetSparePart(Transaction&, const std::string& id) = 0;

  virtual Result UpsertServiceRequest(Transaction&, const model::ServiceRequest&) = 0;

  virtual std::optional<model::ServiceRequest> GetServiceRequest(Transaction&, const std::string& id) = 0;
};

} // namespace outflow::db
