#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/approval.hpp"
#include "internal/model/part_request.hpp"
#include "internal/util/retry.hpp"

namespace outflow::approval {

/*
  Approval trail and approver ranks.

  An approver's rank is the highest approval_level among their role
  assignments. Protected roles are monotonic: once granted they can be
  raised but never lowered or revoked.
*/
class ApprovalOrchestrator {
 public:
  ApprovalOrchestrator(std::shared_ptr<db::Repository> repository, std::vector<std::string> protected_roles, util::RetryPolicy retry);

  model::ApprovalHistory RecordDecision(db::Transaction& tx, const model::SparePartRequest& request, std::uint32_t level,
                                        const std::string& approver_id, model::Decision decision, const std::string& comments,
                                        model::Quantity available_stock);

  std::vector<model::ApprovalHistory> History(const std::string& request_id);

  std::uint32_t ApproverLevel(const std::string& principal_id);
  std::uint32_t ApproverLevel(db::Transaction& tx, const std::string& principal_id);

  // Throws LimitExceeded when the approver ranks below the request's approval_level.
  void RequireRank(db::Transaction& tx, const model::SparePartRequest& request, const std::string& approver_id);

  model::RoleAssignment              GrantRole(const std::string& principal_id, const std::string& role, std::uint32_t level,
                                               const std::string& granted_by);
  void                               RevokeRole(const std::string& principal_id, const std::string& role);
  void                               SetRoles(const std::string& principal_id, const std::vector<model::RoleAssignment>& roles);
  std::vector<model::RoleAssignment> Roles(const std::string& principal_id);

  bool IsProtected(const std::string& role) const {
    return protected_roles_.count(role) > 0;
  }

 private:
  void CheckProtectedLevel(const model::RoleAssignment& existing, std::uint32_t new_level) const;

  std::shared_ptr<db::Repository> repository_;
  std::set<std::string>           protected_roles_;
  util::RetryPolicy               retry_;
};

} // namespace outflow::approval
