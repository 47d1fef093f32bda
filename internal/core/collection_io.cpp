#include "collection_io.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace lieko::core {

void RequireValidId(const std::string& id) {
  if (!model::IsValidId(id)) {
    throw util::ValidationError(util::ErrorCode::InvalidIdFormat, "record id '" + id + "' must match ^[A-Za-z0-9_-]+$");
  }
}

void RequireValidRef(const storage::CollectionRef& ref) {
  if (!model::IsValidId(ref.project_id)) {
    throw util::ValidationError(util::ErrorCode::InvalidRequestBody, "invalid project id '" + ref.project_id + "'");
  }
  if (!model::IsValidId(ref.name)) {
    throw util::ValidationError(util::ErrorCode::InvalidRequestBody, "collection name '" + ref.name + "' must match ^[A-Za-z0-9_-]+$");
  }
}

void StampCreated(model::Record& record, const std::string& now) {
  model::SetString(record, model::kCreatedAtField, now);
  model::SetString(record, model::kUpdatedAtField, now);
}

void StampUpdated(model::Record& record, const std::string& now) {
  model::SetString(record, model::kUpdatedAtField, now);
}

void MergeTopLevel(model::Record& target, const model::Record& patch) {
  for (const auto& [key, value] : patch.fields()) {
    if (key == model::kIdField || key == model::kCreatedAtField || key == model::kUpdatedAtField) continue;
    (*target.mutable_fields())[key] = value;
  }
}

void PersistCollection(EngineContext& ctx, const storage::CollectionRef& ref, const model::RecordMap& records) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    ctx.storage->Persist(ref, records);
  } catch (const util::Error& e) {
    LIEKO_LOG_ERROR("Collection persist failed", {observability::StringField("resource", ref.ResourceKey()),
                                                  observability::StringField("code", util::ErrorCodeName(e.Code())),
                                                  observability::StringField("error", e.what())});
    throw;
  }

  observability::Metrics::Instance().ObservePersistDurationMs(
      ctx.storage->Name(), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

} // namespace lieko::core
