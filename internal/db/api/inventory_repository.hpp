#pragma once

#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/inventory.hpp"

namespace outflow::db {

class InventoryRepository {
 public:
  virtual ~InventoryRepository() = default;

  virtual Result InsertLevel(Transaction&, const model::InventoryLevel&) = 0;

  virtual std::optional<model::InventoryLevel> GetLevel(Transaction&, const model::LevelKey&) = 0;

  // Writes only when the stored version equals level.version; bumps level.version on success.
  virtual Result UpdateLevel(Transaction&, model::InventoryLevel& level) = 0;

  virtual std::vector<model::InventoryLevel> ListLevels(Transaction&) = 0;
};

class MovementRepository {
 public:
  virtual ~MovementRepository() = default;

  // Assigns movement.sequence.
  virtual Result AppendMovement(Transaction&, model::StockMovement& movement) = 0;

  // Ordered by sequence.
  virtual std::vector<model::StockMovement> ListMovements(Transaction&, const model::LevelKey&) = 0;
};

} // namespace outflow::db
