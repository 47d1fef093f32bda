#include "collection_registry.hpp"

#include "internal/db/api/db_errors.hpp"
#include "internal/model/record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lieko::registry {

using util::ErrorCode;

namespace {

void ValidateRef(const storage::CollectionRef& ref) {
  if (!model::IsValidId(ref.project_id)) {
    throw util::ValidationError(ErrorCode::InvalidRequestBody, "invalid project id '" + ref.project_id + "'");
  }
  if (!model::IsValidId(ref.name)) {
    throw util::ValidationError(ErrorCode::InvalidRequestBody, "collection name '" + ref.name + "' must match ^[A-Za-z0-9_-]+$");
  }
}

} // namespace

CollectionRegistry::CollectionRegistry(storage::StorageBackendPtr storage, std::shared_ptr<db::Repository> repository)
    : storage_(std::move(storage)), repository_(std::move(repository)) {
}

void CollectionRegistry::Hydrate() {
  auto tx          = repository_->Begin();
  auto collections = repository_->ListAllCollections(*tx);
  tx->Commit();

  std::lock_guard<std::mutex> lock(mutex_);
  known_.clear();
  for (const auto& c : collections) {
    known_[c.project_id].insert(c.name);
  }

  LIEKO_LOG_INFO("Collection registry hydrated", {observability::IntField("collections", static_cast<std::int64_t>(collections.size()))});
}

void CollectionRegistry::SyncMetadata(const storage::CollectionRef& ref, bool touch_project) {
  auto tx = repository_->Begin();
  if (!repository_->GetProject(*tx, ref.project_id)) {
    throw util::NotFound(ErrorCode::ProjectNotFound, "project '" + ref.project_id + "' not found");
  }

  const auto now = util::ToUnixMillis(util::Now());

  db::model::CollectionRecord record;
  record.project_id    = ref.project_id;
  record.name          = ref.name;
  record.created_at_ms = now;
  record.updated_at_ms = now;
  db::ThrowIfDbError(repository_->RegisterCollection(*tx, record), "register collection " + ref.ResourceKey());

  if (touch_project) {
    db::ThrowIfDbError(repository_->TouchProject(*tx, ref.project_id, now), "touch project " + ref.project_id);
  }
  tx->Commit();
}

bool CollectionRegistry::EnsureExists(const storage::CollectionRef& ref, bool create_if_missing) {
  ValidateRef(ref);

  std::lock_guard<std::mutex> lock(mutex_);

  auto project_it = known_.find(ref.project_id);
  if (project_it != known_.end() && project_it->second.count(ref.name)) {
    return false;
  }

  // data without a metadata entry, e.g. a file copied into place
  if (storage_->Exists(ref)) {
    SyncMetadata(ref, false);
    known_[ref.project_id].insert(ref.name);
    return false;
  }

  if (!create_if_missing) {
    throw util::NotFound(ErrorCode::CollectionNotFound, "collection '" + ref.name + "' not found");
  }

  {
    auto tx = repository_->Begin();
    if (!repository_->GetProject(*tx, ref.project_id)) {
      throw util::NotFound(ErrorCode::ProjectNotFound, "project '" + ref.project_id + "' not found");
    }
  }

  storage_->Persist(ref, model::RecordMap{});
  SyncMetadata(ref, true);
  known_[ref.project_id].insert(ref.name);

  LIEKO_LOG_INFO("Collection created", {observability::StringField("project_id", ref.project_id), observability::StringField("collection", ref.name)});
  return true;
}

void CollectionRegistry::Register(const std::string& project_id, const std::vector<std::string>& names) {
  for (const auto& name : names) {
    ValidateRef({project_id, name});
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto tx = repository_->Begin();
  if (!repository_->GetProject(*tx, project_id)) {
    throw util::NotFound(ErrorCode::ProjectNotFound, "project '" + project_id + "' not found");
  }

  const auto now = util::ToUnixMillis(util::Now());
  for (const auto& name : names) {
    db::model::CollectionRecord record;
    record.project_id    = project_id;
    record.name          = name;
    record.created_at_ms = now;
    record.updated_at_ms = now;
    db::ThrowIfDbError(repository_->RegisterCollection(*tx, record), "register collection " + project_id + "/" + name);
  }
  db::ThrowIfDbError(repository_->TouchProject(*tx, project_id, now), "touch project " + project_id);
  tx->Commit();

  auto& names_for_project = known_[project_id];
  names_for_project.insert(names.begin(), names.end());
}

bool CollectionRegistry::Drop(const storage::CollectionRef& ref) {
  ValidateRef(ref);

  std::lock_guard<std::mutex> lock(mutex_);

  auto project_it = known_.find(ref.project_id);
  bool existed    = (project_it != known_.end() && project_it->second.count(ref.name)) || storage_->Exists(ref);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteCollection(*tx, ref.project_id, ref.name), "delete collection " + ref.ResourceKey());
  if (repository_->GetProject(*tx, ref.project_id)) {
    db::ThrowIfDbError(repository_->TouchProject(*tx, ref.project_id, util::ToUnixMillis(util::Now())), "touch project " + ref.project_id);
  }

  storage_->Remove(ref);
  tx->Commit();

  if (project_it != known_.end()) {
    project_it->second.erase(ref.name);
    if (project_it->second.empty()) known_.erase(project_it);
  }

  if (existed) {
    LIEKO_LOG_INFO("Collection dropped", {observability::StringField("project_id", ref.project_id), observability::StringField("collection", ref.name)});
  }
  return existed;
}

std::vector<db::model::CollectionRecord> CollectionRegistry::List(const std::string& project_id) {
  auto tx          = repository_->Begin();
  auto collections = repository_->ListCollections(*tx, project_id);
  tx->Commit();
  return collections;
}

bool CollectionRegistry::Contains(const storage::CollectionRef& ref) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = known_.find(ref.project_id);
  return it != known_.end() && it->second.count(ref.name) > 0;
}

void CollectionRegistry::ForgetProject(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  known_.erase(project_id);
}

} // namespace lieko::registry
