#include "limit_evaluator.hpp"

#include <algorithm>

namespace outflow::limits {

namespace {

bool Applies(const model::TechnicianLimit& limit, const LimitQuery& query) {
  if (!limit.active) return false;
  if (!limit.category_id.empty() && limit.category_id != query.category_id) return false;
  if (!limit.spare_part_id.empty() && limit.spare_part_id != query.spare_part_id) return false;
  return true;
}

std::string Scope(const model::TechnicianLimit& limit) {
  if (!limit.spare_part_id.empty()) return "part " + limit.spare_part_id;
  if (!limit.category_id.empty()) return "category " + limit.category_id;
  return "general";
}

// Appends one message per exceeded ceiling; zero ceilings are unset.
bool CollectViolations(const model::TechnicianLimit& limit, const LimitQuery& query, std::vector<std::string>* violations) {
  const auto before = violations->size();
  const auto scope  = Scope(limit);

  if (limit.max_value_per_request > 0 && query.request_value > limit.max_value_per_request) {
    violations->push_back(scope + ": value " + std::to_string(query.request_value) + " exceeds per-request limit " +
                          std::to_string(limit.max_value_per_request));
  }
  if (limit.max_quantity_per_request > 0 && query.requested_quantity > limit.max_quantity_per_request) {
    violations->push_back(scope + ": quantity " + std::to_string(query.requested_quantity) + " exceeds per-request limit " +
                          std::to_string(limit.max_quantity_per_request));
  }
  if (limit.max_value_per_day > 0 && query.usage.day + query.request_value > limit.max_value_per_day) {
    violations->push_back(scope + ": daily spend " + std::to_string(query.usage.day + query.request_value) + " exceeds limit " +
                          std::to_string(limit.max_value_per_day));
  }
  if (limit.max_value_per_month > 0 && query.usage.month + query.request_value > limit.max_value_per_month) {
    violations->push_back(scope + ": monthly spend " + std::to_string(query.usage.month + query.request_value) + " exceeds limit " +
                          std::to_string(limit.max_value_per_month));
  }
  return violations->size() > before;
}

} // namespace

LimitEvaluator::LimitEvaluator(std::shared_ptr<db::Repository> repository, std::uint32_t max_level)
    : repository_(std::move(repository)), max_level_(std::max<std::uint32_t>(1, max_level)) {
}

LimitDecision LimitEvaluator::Classify(db::Transaction& tx, const LimitQuery& query) const {
  return Evaluate(repository_->ListLimits(tx, query.technician_id), query, max_level_);
}

LimitDecision LimitEvaluator::Evaluate(const std::vector<model::TechnicianLimit>& limits, const LimitQuery& query, std::uint32_t max_level) {
  const auto clamp = [max_level](std::uint32_t level) { return std::clamp<std::uint32_t>(level, 1, std::max<std::uint32_t>(1, max_level)); };

  LimitDecision decision;
  bool          any_applicable = false;
  bool          any_demand     = false;
  std::uint32_t demand_level   = 0;

  for (const auto& limit : limits) {
    if (!Applies(limit, query)) continue;
    any_applicable = true;

    const bool violated        = CollectViolations(limit, query, &decision.violations);
    const bool above_threshold = limit.requires_approval && query.request_value > limit.auto_approve_below;
    if (violated || above_threshold) {
      any_demand   = true;
      demand_level = std::max(demand_level, limit.approver_level);
    }
  }

  if (!any_applicable) {
    decision.level = clamp(1);
    return decision;
  }
  if (any_demand) {
    decision.level = clamp(demand_level);
    return decision;
  }
  // Every applicable limit had its auto-approve threshold met.
  decision.outcome = Outcome::kAutoApprove;
  decision.level   = 0;
  return decision;
}

} // namespace outflow::limits
