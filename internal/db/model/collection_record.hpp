#pragma once

#include <cstdint>
#include <string>

namespace lieko::db::model {

/*
  One registered collection of a project.

  Registration only records the name; the data lives in the storage
  backend and may not exist yet.
*/

struct CollectionRecord {
  std::string project_id;
  std::string name;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace lieko::db::model
