#pragma once

#include <memory>

#include "internal/db/api/approval_repository.hpp"
#include "internal/db/api/inventory_repository.hpp"
#include "internal/db/api/request_repository.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/settlement_repository.hpp"
#include "internal/db/api/transaction.hpp"

namespace outflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateLevel / UpdateRequest are compare-and-set on version
  - Movements, approvals, installed parts and breakdowns are append-only

  The DB is the source of truth for:
    stock levels and their movement ledger
    request state and reservations
    approval audit trail
    cost settlements
*/

class Repository : public InventoryRepository,
                   public MovementRepository,
                   public RequestRepository,
                   public ReservationRepository,
                   public ApprovalRepository,
                   public LimitRepository,
                   public RoleRepository,
                   public InstallationRepository,
                   public CostRepository,
                   public CatalogRepository {
 public:
  ~Repository() override = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;
};

} // namespace outflow::db
