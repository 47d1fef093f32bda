#pragma once

#include <string>

#include "internal/model/permission.hpp"

namespace lieko::auth {

/*
  What a resolved credential may do.

  A token grant is bound to one project. The admin grant carries no
  project and is accepted everywhere, including project administration.
*/
struct AccessGrant {
  std::string                  project_id;
  lieko::model::PermissionTier tier  = lieko::model::PermissionTier::kNone;
  bool                         admin = false;
};

// Throws PermissionDenied(FORBIDDEN).
void RequireTier(const AccessGrant& grant, lieko::model::PermissionTier required);

/*
  Project a request operates on.

  Token grants may leave requested empty or repeat their own project;
  the admin grant must name one. Throws ValidationError or
  PermissionDenied.
*/
std::string ResolveProject(const AccessGrant& grant, const std::string& requested);

// Admin, or a full token of project_id.
void RequireProjectAdmin(const AccessGrant& grant, const std::string& project_id);

void RequireAdmin(const AccessGrant& grant);

} // namespace lieko::auth
