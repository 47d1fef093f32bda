#include "internal/core/batch_processor.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ram/ram_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using lieko::core::BatchProcessor;
using lieko::core::EngineContext;
using lieko::model::Value;
using lieko::storage::CollectionRef;

const CollectionRef kUsers{"p1", "users"};

struct Fixture {
  EngineContext  ctx;
  BatchProcessor batch;

  Fixture() : ctx(MakeContext()), batch(ctx) {
  }

  static EngineContext MakeContext() {
    auto storage    = std::make_shared<lieko::storage::RamStore>();
    auto repository = std::make_shared<lieko::db::memory::MemoryRepository>();

    auto                            tx = repository->Begin();
    lieko::db::model::ProjectRecord project;
    project.id   = "p1";
    project.name = "first";
    assert(repository->InsertProject(*tx, project));
    tx->Commit();

    EngineContext ctx;
    ctx.storage    = storage;
    ctx.serializer = std::make_shared<lieko::lock::WriteSerializer>();
    ctx.registry   = std::make_shared<lieko::registry::CollectionRegistry>(storage, repository);
    return ctx;
  }
};

Value JsonValue(const std::string& json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &value);
  assert(status.ok());
  return value;
}

google::protobuf::RepeatedPtrField<Value> Records(std::initializer_list<const char*> items) {
  google::protobuf::RepeatedPtrField<Value> out;
  for (const char* item : items) *out.Add() = JsonValue(item);
  return out;
}

google::protobuf::RepeatedPtrField<std::string> Ids(std::initializer_list<const char*> items) {
  google::protobuf::RepeatedPtrField<std::string> out;
  for (const char* item : items) *out.Add() = item;
  return out;
}

void TestBatchSetReportsConflictsPerItem() {
  Fixture f;
  (void)f.batch.BatchSet(kUsers, Records({R"({"id":"u1","n":1})"}));

  auto response = f.batch.BatchSet(kUsers, Records({
                                               R"({"id":"u1","n":2})",
                                               R"({"id":"u2","n":3})",
                                               R"({"name":"generated"})",
                                               R"({"id":"bad id"})",
                                               R"({"id":7})",
                                               R"("not an object")",
                                           }));

  assert(response.total() == 6);
  assert(response.results_size() == 2);
  assert(response.results(0).id() == "u2");
  assert(response.results(0).record().fields().count("createdAt") == 1);
  assert(!response.results(1).id().empty());

  assert(response.errors_size() == 4);
  assert(response.errors(0).id() == "u1" && response.errors(0).code() == "RECORD_EXISTS");
  assert(response.errors(1).id() == "bad id" && response.errors(1).code() == "INVALID_ID_FORMAT");
  assert(response.errors(2).id() == "#4" && response.errors(2).code() == "INVALID_ID_FORMAT");
  assert(response.errors(3).id() == "#5" && response.errors(3).code() == "INVALID_REQUEST_BODY");

  auto stored = f.ctx.storage->Load(kUsers);
  assert(stored.Size() == 3);
  assert(stored.Find("u1")->fields().at("n").number_value() == 1);
}

void TestBatchSetRejectsIdRepeatedInTheSameBatch() {
  Fixture f;

  auto response = f.batch.BatchSet(kUsers, Records({R"({"id":"a","n":1})", R"({"id":"a","n":2})"}));
  assert(response.total() == 2);
  assert(response.results_size() == 1 && response.results(0).id() == "a");
  assert(response.errors_size() == 1);
  assert(response.errors(0).id() == "a" && response.errors(0).code() == "RECORD_EXISTS");

  auto stored = f.ctx.storage->Load(kUsers);
  assert(stored.Size() == 1);
  assert(stored.Find("a")->fields().at("n").number_value() == 1);
}

void TestBatchDeleteOfMissingIdStillSucceeds() {
  Fixture f;
  (void)f.batch.BatchSet(kUsers, Records({R"({"id":"u1"})"}));

  auto response = f.batch.BatchDelete(kUsers, Ids({"u1", "u404"}));
  assert(response.total() == 2);
  assert(response.errors_size() == 0);
  assert(response.results_size() == 2);
  assert(response.results(0).id() == "u1" && response.results(0).status() == "success");
  assert(response.results(1).id() == "u404" && response.results(1).status() == "success");
  assert(response.results(1).message() == "nothing to delete");
  assert(f.ctx.storage->Load(kUsers).Empty());
}

void TestBatchGetSplitsHitsAndMisses() {
  Fixture f;
  (void)f.batch.BatchSet(kUsers, Records({R"({"id":"u1"})", R"({"id":"u2"})"}));

  auto response = f.batch.BatchGet(kUsers, Ids({"u2", "nope", "u1", "bad/id"}));
  assert(response.total() == 4);
  assert(response.results_size() == 2);
  assert(response.results(0).id() == "u2" && response.results(1).id() == "u1");
  assert(response.errors_size() == 2);
  assert(response.errors(0).code() == "RECORD_NOT_FOUND");
  assert(response.errors(1).code() == "INVALID_ID_FORMAT");
}

void TestBatchUpdateMergesAndKeepsCreatedAt() {
  Fixture f;
  auto    created    = f.batch.BatchSet(kUsers, Records({R"({"id":"u1","name":"Ann","age":3})"}));
  auto    created_at = created.results(0).record().fields().at("createdAt").string_value();

  google::protobuf::RepeatedPtrField<lieko::v1::BatchUpdateItem> updates;
  auto*                                                          first = updates.Add();
  first->set_id("u1");
  *first->mutable_data() = JsonValue(R"({"age":4,"createdAt":"1999-01-01T00:00:00Z","id":"hijack"})");
  auto* second           = updates.Add();
  second->set_id("u9");
  *second->mutable_data() = JsonValue(R"({"age":1})");
  auto* third             = updates.Add();
  *third->mutable_data()  = JsonValue(R"({"age":2})");

  auto response = f.batch.BatchUpdate(kUsers, updates);
  assert(response.total() == 3);
  assert(response.results_size() == 1 && response.errors_size() == 2);
  assert(response.errors(0).id() == "u9");
  assert(response.errors(1).id() == "#2" && response.errors(1).code() == "INVALID_ID_FORMAT");

  const auto* stored = f.ctx.storage->Load(kUsers).Find("u1");
  assert(stored);
  assert(stored->fields().at("name").string_value() == "Ann");
  assert(stored->fields().at("age").number_value() == 4);
  assert(stored->fields().at("id").string_value() == "u1");
  assert(stored->fields().at("createdAt").string_value() == created_at);
}

void TestEmptyBatchIsRejected() {
  Fixture f;
  bool    threw = false;
  try {
    (void)f.batch.BatchSet(kUsers, {});
  } catch (const lieko::util::ValidationError& e) {
    threw = e.Code() == lieko::util::ErrorCode::InvalidRequestBody;
  }
  assert(threw);
  assert(!f.ctx.storage->Exists(kUsers));
}

void TestBatchOnMissingCollection() {
  Fixture f;
  bool    threw = false;
  try {
    (void)f.batch.BatchDelete(kUsers, Ids({"u1"}));
  } catch (const lieko::util::NotFound& e) {
    threw = e.Code() == lieko::util::ErrorCode::CollectionNotFound;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBatchSetReportsConflictsPerItem();
  TestBatchSetRejectsIdRepeatedInTheSameBatch();
  TestBatchDeleteOfMissingIdStillSucceeds();
  TestBatchGetSplitsHitsAndMisses();
  TestBatchUpdateMergesAndKeepsCreatedAt();
  TestEmptyBatchIsRejected();
  TestBatchOnMissingCollection();

  std::cout << "lieko_unit_batch_processor: pass\n";
  return 0;
}
