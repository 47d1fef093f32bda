#include "ram_store.hpp"

#include <mutex>

namespace lieko::storage {

model::RecordMap RamStore::Load(const CollectionRef& ref) {
  std::shared_lock lock(mutex_);

  auto it = collections_.find(ref.ResourceKey());
  if (it == collections_.end()) return {};

  return it->second;
}

void RamStore::Persist(const CollectionRef& ref, const model::RecordMap& records) {
  std::unique_lock lock(mutex_);
  collections_[ref.ResourceKey()] = records;
}

bool RamStore::Exists(const CollectionRef& ref) {
  std::shared_lock lock(mutex_);
  return collections_.find(ref.ResourceKey()) != collections_.end();
}

void RamStore::Remove(const CollectionRef& ref) {
  std::unique_lock lock(mutex_);
  collections_.erase(ref.ResourceKey());
}

void RamStore::RemoveProject(const std::string& project_id) {
  const auto prefix = project_id + "/";

  std::unique_lock lock(mutex_);
  for (auto it = collections_.begin(); it != collections_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = collections_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace lieko::storage
