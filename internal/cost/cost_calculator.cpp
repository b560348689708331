#include "cost_calculator.hpp"

#include <cmath>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace outflow::cost {

using model::Money;

namespace {

Money RoundMoney(double amount) {
  return static_cast<Money>(std::llround(amount));
}

} // namespace

Money ApplyPercent(Money amount, double percent) {
  return RoundMoney(static_cast<double>(amount) * percent / 100.0);
}

CostCalculator::CostCalculator(std::shared_ptr<db::Repository> repository, CostRates rates, util::RetryPolicy retry)
    : repository_(std::move(repository)), rates_(rates), retry_(std::move(retry)) {
}

model::ServiceCostBreakdown CostCalculator::Calculate(const std::string& service_request_id, double labor_hours,
                                                      const std::vector<model::SparePartRequest>& requests,
                                                      const std::vector<model::InstalledPart>& installed, const CostRates& rates) {
  model::ServiceCostBreakdown b;
  b.service_request_id   = service_request_id;
  b.labor_hours          = labor_hours;
  b.labor_rate_per_hour  = rates.labor_rate_per_hour;
  b.labor_markup_percent = rates.labor_markup_percent;
  b.overhead_percent     = rates.overhead_percent;
  b.tax_percent          = rates.tax_percent;

  // Issued stock that never came back is charged to the service.
  for (const auto& request : requests) {
    if (request.installed_quantity > 0) {
      b.parts_cost += request.issued_cost - request.returned_quantity * request.issue_unit_cost;
    }
  }

  for (const auto& part : installed) {
    model::CostLine line;
    line.spare_part_id = part.spare_part_id;
    line.quantity      = part.quantity;
    line.unit_cost     = part.unit_cost;
    line.total_cost    = part.total_cost;
    line.selling_price = part.selling_price;
    line.total_revenue = part.total_revenue;
    b.lines.push_back(line);
    b.parts_revenue += part.total_revenue;
  }
  b.parts_markup = b.parts_revenue - b.parts_cost;

  b.labor_cost    = RoundMoney(labor_hours * static_cast<double>(rates.labor_rate_per_hour));
  b.labor_markup  = ApplyPercent(b.labor_cost, rates.labor_markup_percent);
  b.labor_total   = b.labor_cost + b.labor_markup;
  b.overhead_cost = ApplyPercent(b.parts_cost + b.labor_cost, rates.overhead_percent);

  b.subtotal    = b.parts_revenue + b.labor_total + b.overhead_cost;
  b.tax_amount  = ApplyPercent(b.subtotal, rates.tax_percent);
  b.grand_total = b.subtotal + b.tax_amount;

  b.total_revenue = b.subtotal;
  b.total_cost    = b.parts_cost + b.labor_cost + b.overhead_cost;
  b.net_margin    = b.total_revenue - b.total_cost;
  if (b.total_revenue != 0) {
    const double percent = static_cast<double>(b.net_margin) / static_cast<double>(b.total_revenue) * 100.0;
    b.margin_percent     = std::round(percent * 100.0) / 100.0;
  }
  return b;
}

bool CostCalculator::SameInputs(const model::ServiceCostBreakdown& a, const model::ServiceCostBreakdown& b) {
  return a.parts_cost == b.parts_cost && a.parts_revenue == b.parts_revenue && a.labor_hours == b.labor_hours &&
         a.labor_rate_per_hour == b.labor_rate_per_hour && a.labor_markup_percent == b.labor_markup_percent &&
         a.overhead_percent == b.overhead_percent && a.tax_percent == b.tax_percent;
}

model::ServiceCostBreakdown CostCalculator::Compute(const std::string& service_request_id) {
  auto service_lock = service_locks_.Acquire(service_request_id);

  return util::WithRetry(retry_, [&] {
    auto tx      = repository_->Begin();
    auto service = repository_->GetServiceRequest(*tx, service_request_id);
    if (!service) {
      throw util::NotFound("service request " + service_request_id + " not found");
    }

    model::RequestFilter filter;
    filter.service_request_id = service_request_id;
    const auto requests       = repository_->FindRequests(*tx, filter);
    const auto installed      = repository_->ListInstalledParts(*tx, service_request_id);

    auto breakdown = Calculate(service_request_id, service->labor_hours, requests, installed, rates_);

    const auto latest = repository_->GetLatestBreakdown(*tx, service_request_id);
    if (latest && SameInputs(*latest, breakdown)) {
      return *latest;
    }

    breakdown.id               = util::GenerateId();
    breakdown.version          = latest ? latest->version + 1 : 1;
    breakdown.calculated_at_ms = util::NowMs();

    // Another writer stored this version first; recompute on top of it.
    const auto inserted = repository_->InsertBreakdown(*tx, breakdown);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::StaleState("cost breakdown version " + std::to_string(breakdown.version) + " already stored for " + service_request_id);
    }
    db::ThrowIfDbError(inserted, "insert cost breakdown");
    db::CommitOrThrow(*tx, "compute cost for " + service_request_id);

    OUTFLOW_LOG_INFO("cost breakdown stored",
                     {observability::StringField("service_request_id", service_request_id),
                      observability::IntField("version", breakdown.version), observability::MoneyField("grand_total", breakdown.grand_total)});
    return breakdown;
  });
}

std::vector<model::ServiceCostBreakdown> CostCalculator::History(const std::string& service_request_id) {
  auto tx = repository_->Begin();
  return repository_->ListBreakdowns(*tx, service_request_id);
}

} // namespace outflow::cost
