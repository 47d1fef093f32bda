#pragma once

#include <string>

#include "internal/core/engine_context.hpp"
#include "internal/model/record.hpp"

namespace lieko::core {

// Throws ValidationError(INVALID_ID_FORMAT).
void RequireValidId(const std::string& id);

// Project id and collection name. Throws ValidationError(INVALID_REQUEST_BODY).
void RequireValidRef(const storage::CollectionRef& ref);

// createdAt and updatedAt both set to now, caller values discarded.
void StampCreated(model::Record& record, const std::string& now);

void StampUpdated(model::Record& record, const std::string& now);

/*
  Shallow merge: patch keys overwrite, other keys persist. The engine
  owned fields id, createdAt and updatedAt are never taken from patch.
*/
void MergeTopLevel(model::Record& target, const model::Record& patch);

// Persist with timing and failure logging.
void PersistCollection(EngineContext& ctx, const storage::CollectionRef& ref, const model::RecordMap& records);

} // namespace lieko::core
