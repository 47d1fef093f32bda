#include "batch_processor.hpp"

#include <string>

#include "internal/core/collection_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace lieko::core {

using lieko::v1::BatchResponse;
using util::ErrorCode;

namespace {

constexpr const char* kSuccess = "success";

void AddError(BatchResponse& response, const std::string& id, ErrorCode code, const std::string& message) {
  auto* error = response.add_errors();
  error->set_id(id);
  error->set_code(std::string(util::ErrorCodeName(code)));
  error->set_message(message);
}

lieko::v1::ItemResult* AddResult(BatchResponse& response, const std::string& id) {
  auto* result = response.add_results();
  result->set_id(id);
  result->set_status(kSuccess);
  return result;
}

// Stands in for the id of an item that has no usable one.
std::string ItemLabel(int index) {
  return "#" + std::to_string(index);
}

void RequireItems(int count, const char* what) {
  if (count == 0) {
    throw util::ValidationError(ErrorCode::InvalidRequestBody, std::string(what) + " must not be empty");
  }
}

} // namespace

BatchProcessor::BatchProcessor(EngineContext ctx) : ctx_(std::move(ctx)) {
}

BatchResponse BatchProcessor::BatchSet(const storage::CollectionRef& ref, const google::protobuf::RepeatedPtrField<model::Value>& records) {
  RequireItems(records.size(), "records");
  RequireValidRef(ref);

  auto guard = ctx_.serializer->Acquire(ref.ResourceKey());
  ctx_.registry->EnsureExists(ref, true);
  auto stored = ctx_.storage->Load(ref);

  BatchResponse response;
  response.set_total(records.size());

  const auto now     = util::ToIso8601(util::Now());
  bool       mutated = false;

  for (int index = 0; index < records.size(); ++index) {
    const auto& item = records.Get(index);
    if (item.kind_case() != model::Value::kStructValue) {
      AddError(response, ItemLabel(index), ErrorCode::InvalidRequestBody, "record must be an object");
      continue;
    }

    model::Record record = item.struct_value();
    std::string   id;

    auto id_it = record.fields().find(std::string(model::kIdField));
    if (id_it == record.fields().end()) {
      id = util::ToString(util::GenerateUUID());
      model::SetString(record, model::kIdField, id);
    } else if (id_it->second.kind_case() != model::Value::kStringValue) {
      AddError(response, ItemLabel(index), ErrorCode::InvalidIdFormat, "record id must be a string");
      continue;
    } else {
      id = id_it->second.string_value();
    }

    if (!model::IsValidId(id)) {
      AddError(response, id, ErrorCode::InvalidIdFormat, "record id '" + id + "' must match ^[A-Za-z0-9_-]+$");
      continue;
    }
    if (stored.Contains(id)) {
      AddError(response, id, ErrorCode::RecordExists, "record '" + id + "' already exists");
      continue;
    }

    StampCreated(record, now);
    *AddResult(response, id)->mutable_record() = record;
    stored.Insert(id, std::move(record));
    mutated = true;
  }

  if (mutated) {
    PersistCollection(ctx_, ref, stored);
  }
  return response;
}

BatchResponse BatchProcessor::BatchGet(const storage::CollectionRef& ref, const google::protobuf::RepeatedPtrField<std::string>& ids) {
  RequireItems(ids.size(), "ids");

  ctx_.registry->EnsureExists(ref, false);
  auto stored = ctx_.storage->Load(ref);

  BatchResponse response;
  response.set_total(ids.size());

  for (const auto& id : ids) {
    if (!model::IsValidId(id)) {
      AddError(response, id, ErrorCode::InvalidIdFormat, "record id '" + id + "' must match ^[A-Za-z0-9_-]+$");
      continue;
    }

    const auto* record = stored.Find(id);
    if (!record) {
      AddError(response, id, ErrorCode::RecordNotFound, "record '" + id + "' not found");
      continue;
    }
    *AddResult(response, id)->mutable_record() = *record;
  }
  return response;
}

BatchResponse BatchProcessor::BatchDelete(const storage::CollectionRef& ref, const google::protobuf::RepeatedPtrField<std::string>& ids) {
  RequireItems(ids.size(), "ids");
  RequireValidRef(ref);

  auto guard = ctx_.serializer->Acquire(ref.ResourceKey());
  ctx_.registry->EnsureExists(ref, false);
  auto stored = ctx_.storage->Load(ref);

  BatchResponse response;
  response.set_total(ids.size());

  bool mutated = false;
  for (const auto& id : ids) {
    if (!model::IsValidId(id)) {
      AddError(response, id, ErrorCode::InvalidIdFormat, "record id '" + id + "' must match ^[A-Za-z0-9_-]+$");
      continue;
    }

    if (stored.Erase(id)) {
      AddResult(response, id)->set_message("deleted");
      mutated = true;
    } else {
      AddResult(response, id)->set_message("nothing to delete");
    }
  }

  if (mutated) {
    PersistCollection(ctx_, ref, stored);
  }
  return response;
}

BatchResponse BatchProcessor::BatchUpdate(const storage::CollectionRef&                                        ref,
                                          const google::protobuf::RepeatedPtrField<lieko::v1::BatchUpdateItem>& updates) {
  RequireItems(updates.size(), "updates");
  RequireValidRef(ref);

  auto guard = ctx_.serializer->Acquire(ref.ResourceKey());
  ctx_.registry->EnsureExists(ref, false);
  auto stored = ctx_.storage->Load(ref);

  BatchResponse response;
  response.set_total(updates.size());

  const auto now     = util::ToIso8601(util::Now());
  bool       mutated = false;

  for (int index = 0; index < updates.size(); ++index) {
    const auto& update = updates.Get(index);
    const auto& id     = update.id();
    if (!model::IsValidId(id)) {
      AddError(response, id.empty() ? ItemLabel(index) : id, ErrorCode::InvalidIdFormat, "record id '" + id + "' must match ^[A-Za-z0-9_-]+$");
      continue;
    }

    const auto* existing = stored.Find(id);
    if (!existing) {
      AddError(response, id, ErrorCode::RecordNotFound, "record '" + id + "' not found");
      continue;
    }
    if (update.data().kind_case() != model::Value::kStructValue) {
      AddError(response, id, ErrorCode::InvalidRequestBody, "update data must be an object");
      continue;
    }

    model::Record merged = *existing;
    MergeTopLevel(merged, update.data().struct_value());
    StampUpdated(merged, now);

    *AddResult(response, id)->mutable_record() = merged;
    stored.Put(id, std::move(merged));
    mutated = true;
  }

  if (mutated) {
    PersistCollection(ctx_, ref, stored);
  }
  return response;
}

} // namespace lieko::core
