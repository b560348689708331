#pragma once

#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/approval.hpp"
#include "internal/model/technician_limit.hpp"

namespace outflow::db {

class ApprovalRepository {
 public:
  virtual ~ApprovalRepository() = default;

  virtual Result InsertApproval(Transaction&, const model::ApprovalHistory&) = 0;

  // Oldest first.
  virtual std::vector<model::ApprovalHistory> ListApprovals(Transaction&, const std::string& request_id) = 0;
};

class LimitRepository {
 public:
  virtual ~LimitRepository() = default;

  virtual Result UpsertLimit(Transaction&, const model::TechnicianLimit&) = 0;

  virtual std::vector<model::TechnicianLimit> ListLimits(Transaction&, const std::string& technician_id) = 0;
};

class RoleRepository {
 public:
  virtual ~RoleRepository() = default;

  virtual Result UpsertRole(Transaction&, const model::RoleAssignment&) = 0;

  virtual Result DeleteRole(Transaction&, const std::string& principal_id, const std::string& role) = 0;

  virtual std::vector<model::RoleAssignment> ListRoles(Transaction&, const std::string& principal_id) = 0;
};

} // namespace outflow::db
