#pragma once

#include <filesystem>
#include <string>

#include "internal/model/record.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/util/errors.hpp"

namespace lieko::storage::common {

// Names become path components, so they share the record id charset.
inline void ValidateComponent(const std::string& value, const char* what) {
  if (!model::IsValidId(value)) {
    throw util::ValidationError(util::ErrorCode::InvalidRequestBody,
                                std::string(what) + " '" + value + "' must match ^[A-Za-z0-9_-]+$");
  }
}

inline std::filesystem::path ProjectDir(const std::filesystem::path& root, const std::string& project_id) {
  ValidateComponent(project_id, "project id");
  return root / project_id;
}

inline std::filesystem::path CollectionPath(const std::filesystem::path& root, const CollectionRef& ref) {
  ValidateComponent(ref.name, "collection name");
  return ProjectDir(root, ref.project_id) / (ref.name + ".json");
}

} // namespace lieko::storage::common
