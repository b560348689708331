#include "internal/limits/limit_evaluator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using outflow::limits::LimitEvaluator;
using outflow::limits::LimitQuery;
using outflow::model::TechnicianLimit;

TechnicianLimit General(outflow::model::Money auto_approve_below, std::uint32_t approver_level = 1) {
  TechnicianLimit limit;
  limit.id                 = "general";
  limit.technician_id      = "tech-1";
  limit.auto_approve_below = auto_approve_below;
  limit.approver_level     = approver_level;
  return limit;
}

LimitQuery Query(outflow::model::Money value, outflow::model::Quantity quantity = 1) {
  LimitQuery query;
  query.technician_id      = "tech-1";
  query.category_id        = "cat-filters";
  query.spare_part_id      = "part-1";
  query.request_value      = value;
  query.requested_quantity = quantity;
  return query;
}

void TestNoLimitsNeedsFirstLevel() {
  auto decision = LimitEvaluator::Evaluate({}, Query(100), 3);
  assert(!decision.AutoApproved());
  assert(decision.level == 1);
}

void TestBelowThresholdAutoApproves() {
  // 2 units at 75.00 against an auto-approve threshold of 200.00.
  auto decision = LimitEvaluator::Evaluate({General(20000)}, Query(15000, 2), 3);
  assert(decision.AutoApproved());
  assert(decision.level == 0);
  assert(decision.violations.empty());
}

void TestAboveThresholdNeedsApproverLevel() {
  auto decision = LimitEvaluator::Evaluate({General(20000, 2)}, Query(25000), 3);
  assert(!decision.AutoApproved());
  assert(decision.level == 2);
  assert(decision.violations.empty());
}

void TestThresholdIgnoredWhenApprovalNotRequired() {
  auto limit              = General(100);
  limit.requires_approval = false;
  auto decision           = LimitEvaluator::Evaluate({limit}, Query(5000), 3);
  assert(decision.AutoApproved());
}

void TestCeilingViolationsDemandApproval() {
  auto limit                     = General(1000000);
  limit.max_value_per_request    = 10000;
  limit.max_quantity_per_request = 2;
  limit.approver_level           = 2;

  auto decision = LimitEvaluator::Evaluate({limit}, Query(12000, 3), 3);
  assert(!decision.AutoApproved());
  assert(decision.level == 2);
  assert(decision.violations.size() == 2);
}

void TestPeriodUsageCountsTowardCeilings() {
  auto limit                = General(1000000);
  limit.max_value_per_day   = 50000;
  limit.max_value_per_month = 200000;

  auto query        = Query(10000);
  query.usage.day   = 45000;
  query.usage.month = 100000;
  auto decision     = LimitEvaluator::Evaluate({limit}, query, 3);
  assert(!decision.AutoApproved());
  assert(decision.violations.size() == 1);

  query.usage.day   = 0;
  query.usage.month = 195000;
  decision          = LimitEvaluator::Evaluate({limit}, query, 3);
  assert(!decision.AutoApproved());
  assert(decision.violations.size() == 1);

  query.usage.month = 0;
  decision          = LimitEvaluator::Evaluate({limit}, query, 3);
  assert(decision.AutoApproved());
}

void TestScopeFiltersLimits() {
  auto other_category        = General(0, 3);
  other_category.id          = "other";
  other_category.category_id = "cat-other";

  auto inactive   = General(0, 3);
  inactive.id     = "inactive";
  inactive.active = false;

  auto same_category        = General(20000);
  same_category.id          = "filters";
  same_category.category_id = "cat-filters";

  auto decision = LimitEvaluator::Evaluate({other_category, inactive, same_category}, Query(15000), 3);
  assert(decision.AutoApproved());

  // Only out-of-scope limits: treated as no limits at all.
  decision = LimitEvaluator::Evaluate({other_category, inactive}, Query(15000), 3);
  assert(!decision.AutoApproved());
  assert(decision.level == 1);
}

void TestDemandWinsAndTakesHighestLevel() {
  auto lenient             = General(1000000, 1);
  auto part_limit          = General(5000, 3);
  part_limit.id            = "part";
  part_limit.spare_part_id = "part-1";

  auto decision = LimitEvaluator::Evaluate({lenient, part_limit}, Query(15000), 3);
  assert(!decision.AutoApproved());
  assert(decision.level == 3);
}

void TestLevelIsClampedToMaximum() {
  auto decision = LimitEvaluator::Evaluate({General(0, 9)}, Query(100), 3);
  assert(decision.level == 3);

  decision = LimitEvaluator::Evaluate({General(0, 0)}, Query(100), 3);
  assert(decision.level == 1);
}

void TestClassifyReadsTechnicianLimits() {
  auto repo = std::make_shared<outflow::db::memory::MemoryRepository>();
  {
    auto tx    = repo->Begin();
    auto limit  = General(20000, 2);
    auto upsert = repo->UpsertLimit(*tx, limit);
    assert(upsert);
    tx->Commit();
  }

  LimitEvaluator evaluator(repo, 3);
  auto           tx = repo->Begin();
  assert(evaluator.Classify(*tx, Query(15000)).AutoApproved());
  assert(evaluator.Classify(*tx, Query(25000)).level == 2);

  auto other          = Query(25000);
  other.technician_id = "tech-2";
  assert(evaluator.Classify(*tx, other).level == 1);
}

} // namespace

int main() {
  TestNoLimitsNeedsFirstLevel();
  TestBelowThresholdAutoApproves();
  TestAboveThresholdNeedsApproverLevel();
  TestThresholdIgnoredWhenApprovalNotRequired();
  TestCeilingViolationsDemandApproval();
  TestPeriodUsageCountsTowardCeilings();
  TestScopeFiltersLimits();
  TestDemandWinsAndTakesHighestLevel();
  TestLevelIsClampedToMaximum();
  TestClassifyReadsTechnicianLimits();

  std::cout << "outflow_unit_limit_evaluator: pass\n";
  return 0;
}
