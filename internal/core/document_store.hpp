#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/batch_processor.hpp"
#include "internal/core/engine_context.hpp"
#include "internal/query/filter.hpp"
#include "internal/query/pipeline.hpp"

namespace lieko::core {

/*
  Record operations on one collection.

  Reads never take the write lock and may observe a collection while a
  write to it is in flight. Every mutation runs

    validate -> Acquire -> EnsureExists -> Load -> mutate -> Persist

  so collection creation and drop are serialized with record writes.
*/
class DocumentStore {
 public:
  explicit DocumentStore(EngineContext ctx);

  // Throws NotFound(COLLECTION_NOT_FOUND).
  void CheckCollection(const storage::CollectionRef& ref);

  query::Page Query(const storage::CollectionRef& ref, const query::Filter& filter, const query::PageRequest& page);

  /*
    Case-insensitive substring search. Without search_fields every string
    in the record is searched, nested values included.
  */
  query::Page Search(const storage::CollectionRef& ref, const std::string& term, const std::vector<std::string>& search_fields,
                     const query::PageRequest& page);

  // Throws NotFound(RECORD_NOT_FOUND).
  model::Record GetRecord(const storage::CollectionRef& ref, const std::string& id, const std::vector<std::string>& fields = {});

  // First match in insertion order.
  std::optional<model::Record> FindOne(const storage::CollectionRef& ref, const query::Filter& filter);

  uint64_t                                          Count(const storage::CollectionRef& ref, const query::Filter& filter);
  std::vector<std::string>                          Keys(const storage::CollectionRef& ref);
  std::vector<std::pair<std::string, model::Record>> Entries(const storage::CollectionRef& ref);
  uint64_t                                          Size(const storage::CollectionRef& ref);

  // Generates an id when absent. Throws AlreadyExists(RECORD_EXISTS).
  model::Record Create(const storage::CollectionRef& ref, model::Record record);

  // Upsert: merges into an existing record, creates it otherwise.
  model::Record Set(const storage::CollectionRef& ref, const std::string& id, const model::Record& data);

  model::Record Update(const storage::CollectionRef& ref, const std::string& id, const model::Record& patch);

  // false when the id was not present
  bool Delete(const storage::CollectionRef& ref, const std::string& id);

  // The field must already exist and hold a number. Throws ValidationError(INVALID_FIELD).
  model::Record Increment(const storage::CollectionRef& ref, const std::string& id, const std::string& field, double amount = 1);
  model::Record Decrement(const storage::CollectionRef& ref, const std::string& id, const std::string& field, double amount = 1);

  void DropCollection(const storage::CollectionRef& ref);

  BatchProcessor& Batch() {
    return batch_;
  }

 private:
  model::RecordMap LoadExisting(const storage::CollectionRef& ref);

  EngineContext  ctx_;
  BatchProcessor batch_;
};

} // namespace lieko::core
