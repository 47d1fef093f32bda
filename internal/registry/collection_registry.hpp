#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/storage_backend.hpp"

namespace lieko::registry {

/*
  Known collections per project.

  The in-memory cache mirrors the project_collections table of the
  metadata repository. Every cache mutation happens under mutex_ together
  with the metadata transaction that accompanies it, so the two never
  disagree after a call returns.

  Lock order: a collection write lock may be held when calling in;
  the registry never takes a collection write lock itself.
*/
class CollectionRegistry {
 public:
  CollectionRegistry(storage::StorageBackendPtr storage, std::shared_ptr<db::Repository> repository);

  // Fills the cache from persisted metadata.
  void Hydrate();

  /*
    Returns true when the collection was created by this call.

    Throws NotFound(COLLECTION_NOT_FOUND) when the collection is unknown
    and create_if_missing is false, NotFound(PROJECT_NOT_FOUND) when
    metadata has to be written for a project that does not exist.
  */
  bool EnsureExists(const storage::CollectionRef& ref, bool create_if_missing);

  // Registers names without writing any data. Existing entries keep createdAt.
  void Register(const std::string& project_id, const std::vector<std::string>& names);

  // Wipes data and metadata. Returns false when nothing was registered or stored.
  bool Drop(const storage::CollectionRef& ref);

  std::vector<db::model::CollectionRecord> List(const std::string& project_id);

  bool Contains(const storage::CollectionRef& ref) const;

  // Evicts every cached name of a project whose metadata is already gone.
  void ForgetProject(const std::string& project_id);

 private:
  // caller holds mutex_
  void SyncMetadata(const storage::CollectionRef& ref, bool touch_project);

  storage::StorageBackendPtr      storage_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                                               mutex_;
  std::unordered_map<std::string, std::unordered_set<std::string>> known_;
};

} // namespace lieko::registry
