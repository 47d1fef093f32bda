#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/storage_backend.hpp"

namespace lieko::storage {

/*
  RAM collection storage.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamStore final : public StorageBackend {
 public:
  RamStore()           = default;
  ~RamStore() override = default;

  model::RecordMap Load(const CollectionRef& ref) override;

  void Persist(const CollectionRef& ref, const model::RecordMap& records) override;

  bool Exists(const CollectionRef& ref) override;

  void Remove(const CollectionRef& ref) override;

  void RemoveProject(const std::string& project_id) override;

  std::string_view Name() const override {
    return "ram";
  }

 private:
  mutable std::shared_mutex                         mutex_;
  std::unordered_map<std::string, model::RecordMap> collections_;
};

} // namespace lieko::storage
