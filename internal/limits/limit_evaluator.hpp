#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/technician_limit.hpp"

namespace outflow::limits {

// Spend already committed by the technician in the current UTC day and month.
struct PeriodUsage {
  model::Money day   = 0;
  model::Money month = 0;
};

struct LimitQuery {
  std::string     technician_id;
  std::string     category_id;
  std::string     spare_part_id;
  model::Money    request_value      = 0;
  model::Quantity requested_quantity = 0;
  PeriodUsage     usage;
};

enum class Outcome {
  kAutoApprove,
  kRequiresApproval,
};

struct LimitDecision {
  Outcome                  outcome = Outcome::kRequiresApproval;
  std::uint32_t            level   = 1; // 0 for auto-approve
  std::vector<std::string> violations;

  bool AutoApproved() const {
    return outcome == Outcome::kAutoApprove;
  }
};

/*
  Classifies a request value against the technician's limits.

  A limit applies when it is active and its category/part scope is empty or
  matches the request. An applicable limit demands approval when one of its
  ceilings is exceeded, or when it requires approval and the value is above
  its auto-approve threshold. Any demand wins over any auto-approve; the
  level is the highest approver_level among the demanding limits, clamped to
  [1, max_level]. Without applicable limits the request needs level 1.
*/
class LimitEvaluator {
 public:
  LimitEvaluator(std::shared_ptr<db::Repository> repository, std::uint32_t max_level);

  LimitDecision Classify(db::Transaction& tx, const LimitQuery& query) const;

  static LimitDecision Evaluate(const std::vector<model::TechnicianLimit>& limits, const LimitQuery& query, std::uint32_t max_level);

  std::uint32_t MaxLevel() const {
    return max_level_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::uint32_t                   max_level_;
};

} // namespace outflow::limits
