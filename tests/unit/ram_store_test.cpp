#include "internal/storage/ram/ram_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/storage/common/record_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using lieko::model::Record;
using lieko::model::RecordMap;
using lieko::storage::CollectionRef;
using lieko::storage::RamStore;

Record Json(const std::string& json) {
  Record record;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &record);
  assert(status.ok());
  return record;
}

RecordMap Sample() {
  RecordMap records;
  records.Insert("u2", Json(R"({"id":"u2","name":"Ann"})"));
  records.Insert("u1", Json(R"({"id":"u1","name":"Bob","tags":["x"],"meta":{"n":1}})"));
  return records;
}

void TestLoadOfUnknownCollectionIsEmpty() {
  RamStore store;
  assert(store.Load({"p1", "users"}).Empty());
  assert(!store.Exists({"p1", "users"}));
}

void TestPersistReplacesWholeCollection() {
  RamStore            store;
  const CollectionRef ref{"p1", "users"};

  store.Persist(ref, Sample());
  assert(store.Exists(ref));
  assert(store.Load(ref).Size() == 2);

  RecordMap replacement;
  replacement.Insert("u9", Json(R"({"id":"u9"})"));
  store.Persist(ref, replacement);

  const auto loaded = store.Load(ref);
  assert(loaded.Size() == 1);
  assert(loaded.Contains("u9"));
}

void TestRemoveProjectOnlyTouchesThatProject() {
  RamStore store;
  store.Persist({"p1", "users"}, Sample());
  store.Persist({"p1", "orders"}, Sample());
  store.Persist({"p10", "users"}, Sample());

  store.RemoveProject("p1");
  assert(!store.Exists({"p1", "users"}));
  assert(!store.Exists({"p1", "orders"}));
  assert(store.Exists({"p10", "users"}));

  store.Remove({"p10", "users"});
  store.Remove({"p10", "users"});
  assert(!store.Exists({"p10", "users"}));
}

void TestCodecPreservesOrderAndContent() {
  const auto original = Sample();
  const auto json     = lieko::storage::common::EncodeCollection(original);
  const auto decoded  = lieko::storage::common::DecodeCollection(json, "sample");

  assert(decoded.Ids() == original.Ids());
  assert(decoded.Find("u1")->fields().at("meta").struct_value().fields().at("n").number_value() == 1);
  assert(lieko::storage::common::DecodeCollection("", "empty").Empty());
}

void TestCodecRejectsBadDocuments() {
  const char* bad_documents[] = {
      "not json",
      R"({"records":[{"name":"no id"}]})",
      R"({"records":[{"id":"bad id"}]})",
      R"({"records":[{"id":"a"},{"id":"a"}]})",
  };

  for (const char* doc : bad_documents) {
    bool threw = false;
    try {
      (void)lieko::storage::common::DecodeCollection(doc, "bad");
    } catch (const lieko::util::StorageError& e) {
      threw = e.Code() == lieko::util::ErrorCode::JsonParsingError;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestLoadOfUnknownCollectionIsEmpty();
  TestPersistReplacesWholeCollection();
  TestRemoveProjectOnlyTouchesThatProject();
  TestCodecPreservesOrderAndContent();
  TestCodecRejectsBadDocuments();

  std::cout << "lieko_unit_ram_store: pass\n";
  return 0;
}
