#pragma once

#include <filesystem>

#include "internal/storage/storage_backend.hpp"

namespace lieko::storage {

/*
  Durable disk storage using Arrow IO.

  Layout:
    <root>/<project_id>/<collection>.json

  Properties:
    - whole-file rewrite per mutation
    - atomic replace writes
    - optional flush before rename
*/

class DiskJsonStore final : public StorageBackend {
 public:
  explicit DiskJsonStore(std::filesystem::path root, bool fsync = false);

  model::RecordMap Load(const CollectionRef& ref) override;

  void Persist(const CollectionRef& ref, const model::RecordMap& records) override;

  bool Exists(const CollectionRef& ref) override;

  void Remove(const CollectionRef& ref) override;

  void RemoveProject(const std::string& project_id) override;

  std::string_view Name() const override {
    return "disk";
  }

 private:
  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace lieko::storage
