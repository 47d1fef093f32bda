#include "internal/core/document_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ram/ram_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using lieko::core::DocumentStore;
using lieko::core::EngineContext;
using lieko::model::Record;
using lieko::storage::CollectionRef;
using lieko::util::ErrorCode;

const CollectionRef kUsers{"p1", "users"};

EngineContext MakeContext() {
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

Record Json(const std::string& json) {
  Record record;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &record);
  assert(status.ok());
  return record;
}

template <typename Fn>
ErrorCode CodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const lieko::util::Error& e) {
    return e.Code();
  }
  assert(false && "expected an error");
  return ErrorCode::DatabaseError;
}

void TestSetCreatesCollectionAndStampsRecord() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  (void)store.Set(kUsers, "u1", Json(R"({"name":"Bob"})"));

  auto record = store.GetRecord(kUsers, "u1");
  assert(record.fields().at("id").string_value() == "u1");
  assert(record.fields().at("name").string_value() == "Bob");
  assert(!record.fields().at("createdAt").string_value().empty());
  assert(record.fields().at("createdAt").string_value() == record.fields().at("updatedAt").string_value());
  assert(ctx.registry->Contains(kUsers));
}

void TestSetMergesIntoExisting() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  auto first  = store.Set(kUsers, "u1", Json(R"({"name":"Bob","age":3})"));
  auto second = store.Set(kUsers, "u1", Json(R"({"age":4,"createdAt":"x"})"));

  assert(second.fields().at("name").string_value() == "Bob");
  assert(second.fields().at("age").number_value() == 4);
  assert(second.fields().at("createdAt").string_value() == first.fields().at("createdAt").string_value());
  assert(store.Size(kUsers) == 1);
}

void TestCreateConflictLeavesRecordUntouched() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  auto created = store.Create(kUsers, Json(R"({"id":"u1","name":"Ann"})"));
  assert(CodeOf([&] { store.Create(kUsers, Json(R"({"id":"u1","name":"Other"})")); }) == ErrorCode::RecordExists);
  assert(store.GetRecord(kUsers, "u1").fields().at("name").string_value() == "Ann");

  auto generated = store.Create(kUsers, Json(R"({"name":"NoId"})"));
  assert(lieko::model::IsValidId(generated.fields().at("id").string_value()));
  assert(store.Size(kUsers) == 2);

  assert(CodeOf([&] { store.Create(kUsers, Json(R"({"id":5})")); }) == ErrorCode::InvalidIdFormat);
  assert(CodeOf([&] { store.Create(kUsers, Json(R"({"id":"a b"})")); }) == ErrorCode::InvalidIdFormat);
  (void)created;
}

void TestReadsRequireExistingCollection() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  assert(CodeOf([&] { store.Query(kUsers, {}, {}); }) == ErrorCode::CollectionNotFound);
  assert(CodeOf([&] { store.Keys(kUsers); }) == ErrorCode::CollectionNotFound);
  assert(CodeOf([&] { store.Update(kUsers, "u1", {}); }) == ErrorCode::CollectionNotFound);
  assert(!ctx.storage->Exists(kUsers));

  (void)store.Set(kUsers, "u1", {});
  assert(CodeOf([&] { store.GetRecord(kUsers, "nope"); }) == ErrorCode::RecordNotFound);
  assert(CodeOf([&] { store.GetRecord(kUsers, "../etc"); }) == ErrorCode::InvalidIdFormat);
  assert(CodeOf([&] { store.Update(kUsers, "nope", {}); }) == ErrorCode::RecordNotFound);
  assert(!store.FindOne(kUsers, Json(R"({"name":"nobody"})")).has_value());
}

void TestDeleteTwice() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  (void)store.Set(kUsers, "u1", {});
  assert(store.Delete(kUsers, "u1"));
  assert(!store.Delete(kUsers, "u1"));
  assert(store.Size(kUsers) == 0);
}

void TestQueryFiltersSortsAndPages() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  for (int i = 0; i < 6; ++i) {
    (void)store.Set(kUsers, "u" + std::to_string(i), Json(R"({"age":)" + std::to_string(10 - i) + R"(,"even":)" + (i % 2 ? "false" : "true") + "}"));
  }

  lieko::query::PageRequest request;
  request.sort   = lieko::query::SortSpec{"age", false};
  request.limit  = 2;
  request.fields = {"id"};

  auto page = store.Query(kUsers, Json(R"({"even":true})"), request);
  assert(page.total_count == 3);
  assert(page.max_page == 2);
  assert(page.records.size() == 2);
  assert(page.records[0].fields().at("id").string_value() == "u4");
  assert(page.records[0].fields().size() == 1);

  assert(store.Count(kUsers, Json(R"({"age":{"$gte":8}})")) == 3);
  assert(store.Count(kUsers, {}) == 6);

  auto keys = store.Keys(kUsers);
  assert(keys.size() == 6 && keys.front() == "u0" && keys.back() == "u5");

  auto entries = store.Entries(kUsers);
  assert(entries[2].first == "u2" && entries[2].second.fields().at("age").number_value() == 8);

  auto found = store.FindOne(kUsers, Json(R"({"even":false})"));
  assert(found && found->fields().at("id").string_value() == "u1");
}

void TestSearch() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  (void)store.Set(kUsers, "a", Json(R"({"name":"Bob Smith"})"));
  (void)store.Set(kUsers, "b", Json(R"({"email":"bob@x.com"})"));
  (void)store.Set(kUsers, "c", Json(R"({"name":"Carl","profile":{"nick":"BOBBY"}})"));
  (void)store.Set(kUsers, "d", Json(R"({"name":"Dan"})"));

  assert(store.Search(kUsers, "bob", {}, {}).total_count == 3);
  assert(store.Search(kUsers, "bob", {"name"}, {}).total_count == 1);
  assert(store.Search(kUsers, "bob", {"profile.nick"}, {}).total_count == 1);
  assert(CodeOf([&] { store.Search(kUsers, "", {}, {}); }) == ErrorCode::MissingRequiredFields);
}

void TestIncrementPolicy() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  (void)store.Set(kUsers, "u1", Json(R"({"name":"Bob","stats":{"score":1}})"));

  assert(CodeOf([&] { store.Increment(kUsers, "u1", "score", 5); }) == ErrorCode::InvalidField);
  assert(CodeOf([&] { store.Increment(kUsers, "u1", "name", 5); }) == ErrorCode::InvalidField);
  assert(CodeOf([&] { store.Increment(kUsers, "u1", "", 5); }) == ErrorCode::MissingRequiredFields);
  assert(CodeOf([&] { store.Increment(kUsers, "u9", "stats.score", 5); }) == ErrorCode::RecordNotFound);
  assert(store.GetRecord(kUsers, "u1").fields().count("score") == 0);

  auto bumped = store.Increment(kUsers, "u1", "stats.score", 5);
  assert(bumped.fields().at("stats").struct_value().fields().at("score").number_value() == 6);

  auto lowered = store.Decrement(kUsers, "u1", "stats.score");
  assert(lowered.fields().at("stats").struct_value().fields().at("score").number_value() == 5);
}

void TestConcurrentIncrementsAreNotLost() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);
  (void)store.Set(kUsers, "counter", Json(R"({"n":0})"));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) (void)store.Increment(kUsers, "counter", "n", 1);
    });
  }
  for (auto& t : threads) t.join();

  assert(store.GetRecord(kUsers, "counter").fields().at("n").number_value() == 200);
}

void TestDropCollection() {
  auto          ctx = MakeContext();
  DocumentStore store(ctx);

  (void)store.Set(kUsers, "u1", {});
  store.DropCollection(kUsers);
  assert(!ctx.storage->Exists(kUsers));
  assert(CodeOf([&] { store.CheckCollection(kUsers); }) == ErrorCode::CollectionNotFound);
  assert(CodeOf([&] { store.DropCollection(kUsers); }) == ErrorCode::CollectionNotFound);
}

} // namespace

int main() {
  TestSetCreatesCollectionAndStampsRecord();
  TestSetMergesIntoExisting();
  TestCreateConflictLeavesRecordUntouched();
  TestReadsRequireExistingCollection();
  TestDeleteTwice();
  TestQueryFiltersSortsAndPages();
  TestSearch();
  TestIncrementPolicy();
  TestConcurrentIncrementsAreNotLost();
  TestDropCollection();

  std::cout << "lieko_unit_document_store: pass\n";
  return 0;
}
