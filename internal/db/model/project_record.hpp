#pragma once

#include <cstdint>
#include <string>

namespace lieko::db::model {

/*
  Persistent project row.

  Collections and tokens reference it and go away with it.
*/

struct ProjectRecord {
  std::string id;

  std::string name;
  std::string description;
  std::string owner_id;

  // epoch ms
  uint64_t created_at_ms = 0;
  // bumped whenever the collection list changes
  uint64_t updated_at_ms = 0;
};

} // namespace lieko::db::model
