#include "internal/approval/approval_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using outflow::approval::ApprovalOrchestrator;
using outflow::db::memory::MemoryRepository;
using outflow::model::Decision;
using outflow::model::RoleAssignment;

std::shared_ptr<ApprovalOrchestrator> MakeOrchestrator(std::shared_ptr<MemoryRepository> repo) {
  outflow::util::RetryPolicy retry;
  retry.max_attempts = 50;
  return std::make_shared<ApprovalOrchestrator>(std::move(repo), std::vector<std::string>{"super_admin"}, retry);
}

outflow::model::SparePartRequest RequestAtLevel(std::uint32_t approval_level) {
  outflow::model::SparePartRequest request;
  request.id             = "req-1";
  request.spare_part_id  = "part-1";
  request.store_id       = "store-1";
  request.estimated_cost = 15000;
  request.approval_level = approval_level;
  return request;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRankIsHighestGrantedLevel() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto approvals = MakeOrchestrator(repo);

  assert(approvals->ApproverLevel("mgr-1") == 0);
  approvals->GrantRole("mgr-1", "store_manager", 1, "admin");
  approvals->GrantRole("mgr-1", "regional_manager", 2, "admin");
  assert(approvals->ApproverLevel("mgr-1") == 2);
  assert(approvals->Roles("mgr-1").size() == 2);

  approvals->RevokeRole("mgr-1", "regional_manager");
  assert(approvals->ApproverLevel("mgr-1") == 1);
}

void TestRequireRank() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto approvals = MakeOrchestrator(repo);
  approvals->GrantRole("mgr-1", "store_manager", 1, "admin");
  approvals->GrantRole("mgr-2", "regional_manager", 2, "admin");

  auto tx      = repo->Begin();
  auto request = RequestAtLevel(2);

  bool threw = false;
  try {
    approvals->RequireRank(*tx, request, "mgr-1");
  } catch (const outflow::util::LimitExceeded& e) {
    threw = true;
    assert(e.Context().request_id == "req-1");
    assert(e.Context().requested == 2);
    assert(e.Context().available == 1);
  }
  assert(threw);
  approvals->RequireRank(*tx, request, "mgr-2");

  // Level 0 still needs somebody with a rank.
  auto auto_level = RequestAtLevel(0);
  assert(Throws<outflow::util::LimitExceeded>([&] { approvals->RequireRank(*tx, auto_level, "nobody"); }));
  approvals->RequireRank(*tx, auto_level, "mgr-1");
}

void TestProtectedRoleOnlyGrows() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto approvals = MakeOrchestrator(repo);
  assert(approvals->IsProtected("super_admin"));
  assert(!approvals->IsProtected("store_manager"));

  approvals->GrantRole("root-1", "super_admin", 3, "bootstrap");

  assert(Throws<outflow::util::ProtectedRoleViolation>([&] { approvals->GrantRole("root-1", "super_admin", 2, "admin"); }));
  assert(Throws<outflow::util::ProtectedRoleViolation>([&] { approvals->RevokeRole("root-1", "super_admin"); }));
  assert(approvals->ApproverLevel("root-1") == 3);

  approvals->GrantRole("root-1", "super_admin", 4, "admin");
  assert(approvals->ApproverLevel("root-1") == 4);
}

void TestSetRolesKeepsProtectedAssignments() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto approvals = MakeOrchestrator(repo);
  approvals->GrantRole("root-1", "super_admin", 3, "bootstrap");
  approvals->GrantRole("root-1", "store_manager", 1, "bootstrap");

  RoleAssignment store_only;
  store_only.role           = "store_manager";
  store_only.approval_level = 1;
  assert(Throws<outflow::util::ProtectedRoleViolation>([&] { approvals->SetRoles("root-1", {store_only}); }));
  assert(approvals->Roles("root-1").size() == 2);

  RoleAssignment keep_admin;
  keep_admin.role           = "super_admin";
  keep_admin.approval_level = 3;
  approvals->SetRoles("root-1", {keep_admin});

  auto roles = approvals->Roles("root-1");
  assert(roles.size() == 1);
  assert(roles[0].role == "super_admin");
  assert(roles[0].approval_level == 3);
}

void TestDecisionsAreAppendedInOrder() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto approvals = MakeOrchestrator(repo);
  auto request   = RequestAtLevel(1);

  {
    auto tx = repo->Begin();
    approvals->RecordDecision(*tx, request, 1, "system", Decision::kPending, "Awaiting approval", 8);
    approvals->RecordDecision(*tx, request, 2, "mgr-1", Decision::kEscalated, "needs regional", 8);
    approvals->RecordDecision(*tx, request, 2, "mgr-2", Decision::kApproved, "ok", 8);
    tx->Commit();
  }

  auto history = approvals->History("req-1");
  assert(history.size() == 3);
  assert(history[0].decision == Decision::kPending);
  assert(history[1].decision == Decision::kEscalated);
  assert(history[1].level == 2);
  assert(history[2].approver_id == "mgr-2");
  assert(history[2].request_value == 15000);
  assert(history[2].available_stock == 8);
  assert(approvals->History("req-other").empty());
}

void TestGrantRequiresNames() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto approvals = MakeOrchestrator(repo);
  assert(Throws<outflow::util::InvalidArgument>([&] { approvals->GrantRole("", "store_manager", 1, "admin"); }));
  assert(Throws<outflow::util::InvalidArgument>([&] { approvals->GrantRole("mgr-1", "", 1, "admin"); }));
}

} // namespace

int main() {
  TestRankIsHighestGrantedLevel();
  TestRequireRank();
  TestProtectedRoleOnlyGrows();
  TestSetRolesKeepsProtectedAssignments();
  TestDecisionsAreAppendedInOrder();
  TestGrantRequiresNames();

  std::cout << "outflow_unit_approval_orchestrator: pass\n";
  return 0;
}
