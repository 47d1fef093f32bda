#include "access.hpp"

#include "internal/util/errors.hpp"

namespace lieko::auth {

using lieko::model::PermissionTier;

void RequireTier(const AccessGrant& grant, PermissionTier required) {
  if (grant.admin) return;
  if (!lieko::model::Covers(grant.tier, required)) {
    throw util::PermissionDenied("token permission '" + std::string(lieko::model::ToString(grant.tier)) + "' does not allow '" +
                                 std::string(lieko::model::ToString(required)) + "' operations");
  }
}

std::string ResolveProject(const AccessGrant& grant, const std::string& requested) {
  if (grant.admin) {
    if (requested.empty()) {
      throw util::ValidationError(util::ErrorCode::MissingRequiredFields, "project_id is required with the admin key");
    }
    return requested;
  }

  if (!requested.empty() && requested != grant.project_id) {
    throw util::PermissionDenied("token does not belong to project '" + requested + "'");
  }
  return grant.project_id;
}

void RequireProjectAdmin(const AccessGrant& grant, const std::string& project_id) {
  if (grant.admin) return;
  if (grant.project_id != project_id) {
    throw util::PermissionDenied("token does not belong to project '" + project_id + "'");
  }
  RequireTier(grant, PermissionTier::kFull);
}

void RequireAdmin(const AccessGrant& grant) {
  if (!grant.admin) {
    throw util::PermissionDenied("admin key required");
  }
}

} // namespace lieko::auth
