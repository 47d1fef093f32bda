#pragma once

#include <cstdint>
#include <string>

#include "internal/model/permission.hpp"

namespace lieko::db::model {

/*
  Project access token.

  secret is what clients send; id is what administrators refer to.
*/

struct TokenRecord {
  std::string id;
  std::string project_id;
  std::string name;
  std::string secret;

  lieko::model::PermissionTier permission = lieko::model::PermissionTier::kNone;

  bool active = true;

  uint64_t created_at_ms = 0;
};

} // namespace lieko::db::model
