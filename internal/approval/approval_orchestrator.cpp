#include "approval_orchestrator.hpp"

#include <algorithm>
#include <map>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace outflow::approval {

ApprovalOrchestrator::ApprovalOrchestrator(std::shared_ptr<db::Repository> repository, std::vector<std::string> protected_roles,
                                           util::RetryPolicy retry)
    : repository_(std::move(repository)), protected_roles_(protected_roles.begin(), protected_roles.end()), retry_(std::move(retry)) {
}

model::ApprovalHistory ApprovalOrchestrator::RecordDecision(db::Transaction& tx, const model::SparePartRequest& request, std::uint32_t level,
                                                            const std::string& approver_id, model::Decision decision,
                                                            const std::string& comments, model::Quantity available_stock) {
  model::ApprovalHistory entry;
  entry.id              = util::GenerateId();
  entry.request_id      = request.id;
  entry.level           = level;
  entry.approver_id     = approver_id;
  entry.decision        = decision;
  entry.comments        = comments;
  entry.request_value   = request.estimated_cost;
  entry.available_stock = available_stock;
  entry.decided_at_ms   = util::NowMs();

  util::ErrorContext context;
  context.request_id    = request.id;
  context.spare_part_id = request.spare_part_id;
  db::ThrowIfDbError(repository_->InsertApproval(tx, entry), "record approval decision", std::move(context));
  return entry;
}

std::vector<model::ApprovalHistory> ApprovalOrchestrator::History(const std::string& request_id) {
  auto tx = repository_->Begin();
  return repository_->ListApprovals(*tx, request_id);
}

std::uint32_t ApprovalOrchestrator::ApproverLevel(const std::string& principal_id) {
  auto tx = repository_->Begin();
  return ApproverLevel(*tx, principal_id);
}

std::uint32_t ApprovalOrchestrator::ApproverLevel(db::Transaction& tx, const std::string& principal_id) {
  std::uint32_t level = 0;
  for (const auto& assignment : repository_->ListRoles(tx, principal_id)) {
    level = std::max(level, assignment.approval_level);
  }
  return level;
}

void ApprovalOrchestrator::RequireRank(db::Transaction& tx, const model::SparePartRequest& request, const std::string& approver_id) {
  const auto required = std::max<std::uint32_t>(1, request.approval_level);
  const auto held     = ApproverLevel(tx, approver_id);
  if (held >= required) {
    return;
  }

  util::ErrorContext context;
  context.request_id    = request.id;
  context.spare_part_id = request.spare_part_id;
  context.store_id      = request.store_id;
  context.requested     = required;
  context.available     = held;
  throw util::LimitExceeded("approver " + approver_id + " holds level " + std::to_string(held) + " but request requires level " +
                                std::to_string(required) + "; escalate",
                            std::move(context));
}

void ApprovalOrchestrator::CheckProtectedLevel(const model::RoleAssignment& existing, std::uint32_t new_level) const {
  if (IsProtected(existing.role) && new_level < existing.approval_level) {
    throw util::ProtectedRoleViolation("protected role " + existing.role + " of " + existing.principal_id + " cannot be lowered from level " +
                                       std::to_string(existing.approval_level) + " to " + std::to_string(new_level));
  }
}

model::RoleAssignment ApprovalOrchestrator::GrantRole(const std::string& principal_id, const std::string& role, std::uint32_t level,
                                                      const std::string& granted_by) {
  if (principal_id.empty() || role.empty()) {
    throw util::InvalidArgument("principal and role are required");
  }

  auto granted = util::WithRetry(retry_, [&] {
    auto tx = repository_->Begin();
    for (const auto& existing : repository_->ListRoles(*tx, principal_id)) {
      if (existing.role == role) {
        CheckProtectedLevel(existing, level);
      }
    }

    model::RoleAssignment assignment;
    assignment.principal_id   = principal_id;
    assignment.role           = role;
    assignment.approval_level = level;
    assignment.granted_by     = granted_by;
    assignment.granted_at_ms  = util::NowMs();
    db::ThrowIfDbError(repository_->UpsertRole(*tx, assignment), "grant role");
    db::CommitOrThrow(*tx, "grant role " + role + " to " + principal_id);
    return assignment;
  });

  OUTFLOW_LOG_INFO("role granted", {observability::StringField("principal_id", principal_id), observability::StringField("role", role),
                                    observability::IntField("level", level), observability::StringField("granted_by", granted_by)});
  return granted;
}

void ApprovalOrchestrator::RevokeRole(const std::string& principal_id, const std::string& role) {
  if (IsProtected(role)) {
    throw util::ProtectedRoleViolation("protected role " + role + " of " + principal_id + " cannot be revoked");
  }

  util::WithRetry(retry_, [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->DeleteRole(*tx, principal_id, role), "revoke role " + role + " from " + principal_id);
    db::CommitOrThrow(*tx, "revoke role " + role + " from " + principal_id);
  });

  OUTFLOW_LOG_INFO("role revoked", {observability::StringField("principal_id", principal_id), observability::StringField("role", role)});
}

void ApprovalOrchestrator::SetRoles(const std::string& principal_id, const std::vector<model::RoleAssignment>& roles) {
  std::map<std::string, std::uint32_t> wanted;
  for (const auto& assignment : roles) {
    if (assignment.role.empty()) {
      throw util::InvalidArgument("role name is required");
    }
    wanted[assignment.role] = assignment.approval_level;
  }

  util::WithRetry(retry_, [&] {
    auto       tx       = repository_->Begin();
    const auto existing = repository_->ListRoles(*tx, principal_id);

    // Validate everything before the first write.
    for (const auto& current : existing) {
      auto it = wanted.find(current.role);
      if (it == wanted.end()) {
        if (IsProtected(current.role)) {
          throw util::ProtectedRoleViolation("protected role " + current.role + " of " + principal_id + " cannot be removed");
        }
        continue;
      }
      CheckProtectedLevel(current, it->second);
    }

    for (const auto& current : existing) {
      if (wanted.count(current.role) == 0) {
        db::ThrowIfDbError(repository_->DeleteRole(*tx, principal_id, current.role), "remove role " + current.role);
      }
    }

    const auto now_ms = util::NowMs();
    for (const auto& assignment : roles) {
      auto row           = assignment;
      row.principal_id   = principal_id;
      row.approval_level = wanted[assignment.role];
      row.granted_at_ms  = now_ms;
      db::ThrowIfDbError(repository_->UpsertRole(*tx, row), "set role " + row.role);
    }
    db::CommitOrThrow(*tx, "set roles for " + principal_id);
  });
}

std::vector<model::RoleAssignment> ApprovalOrchestrator::Roles(const std::string& principal_id) {
  auto tx = repository_->Begin();
  return repository_->ListRoles(*tx, principal_id);
}

} // namespace outflow::approval
