#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/cost_breakdown.hpp"
#include "internal/model/installed_part.hpp"
#include "internal/model/part_request.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/retry.hpp"

namespace outflow::cost {

// Percentages are plain percent (18.0 = 18%).
struct CostRates {
  model::Money labor_rate_per_hour  = 50000; // 500.00 per hour
  double       labor_markup_percent = 20.0;
  double       overhead_percent     = 10.0;
  double       tax_percent          = 18.0;
};

// Multiplies and rounds half away from zero to whole minor units.
model::Money ApplyPercent(model::Money amount, double percent);

/*
  Settlement of a service request.

  Parts are charged at the cost they were issued at, less anything returned;
  revenue comes from installed parts at their selling price. Breakdowns are
  immutable: Compute() returns the latest one when none of its inputs
  changed and otherwise stores version + 1.
*/
class CostCalculator {
 public:
  CostCalculator(std::shared_ptr<db::Repository> repository, CostRates rates, util::RetryPolicy retry);

  model::ServiceCostBreakdown              Compute(const std::string& service_request_id);
  std::vector<model::ServiceCostBreakdown> History(const std::string& service_request_id);

  static model::ServiceCostBreakdown Calculate(const std::string& service_request_id, double labor_hours,
                                               const std::vector<model::SparePartRequest>& requests,
                                               const std::vector<model::InstalledPart>& installed, const CostRates& rates);

  static bool SameInputs(const model::ServiceCostBreakdown& a, const model::ServiceCostBreakdown& b);

  const CostRates& Rates() const {
    return rates_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  CostRates                       rates_;
  util::RetryPolicy               retry_;
  util::KeyedMutex                service_locks_;
};

} // namespace outflow::cost
