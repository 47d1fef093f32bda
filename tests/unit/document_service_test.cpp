#include "internal/service/document_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>

#include "internal/auth/token_authenticator.hpp"
#include "internal/core/document_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ram/ram_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace lieko::v1;
using lieko::model::PermissionTier;
using lieko::service::DocumentService;
using lieko::service::ServiceContext;
using lieko::util::ErrorCode;

constexpr const char* kAdmin = "admin-key";
constexpr const char* kRead  = "Bearer read-secret";
constexpr const char* kWrite = "Bearer write-secret";
constexpr const char* kFull  = "Bearer full-secret";
constexpr const char* kOther = "Bearer other-secret";

void AddToken(lieko::db::Repository& repository, lieko::db::Transaction& tx, const std::string& project, const std::string& secret,
              PermissionTier tier) {
  lieko::db::model::TokenRecord token;
  token.id         = secret;
  token.project_id = project;
  token.name       = secret;
  token.secret     = secret;
  token.permission = tier;
  assert(repository.InsertToken(tx, token));
}

ServiceContext MakeContext() {
  auto storage    = std::make_shared<lieko::storage::RamStore>();
  auto repository = std::make_shared<lieko::db::memory::MemoryRepository>();
  auto serializer = std::make_shared<lieko::lock::WriteSerializer>();
  auto registry   = std::make_shared<lieko::registry::CollectionRegistry>(storage, repository);

  {
    auto tx = repository->Begin();
    for (const char* id : {"p1", "p2"}) {
      lieko::db::model::ProjectRecord project;
      project.id   = id;
      project.name = id;
      assert(repository->InsertProject(*tx, project));
    }
    AddToken(*repository, *tx, "p1", "read-secret", PermissionTier::kRead);
    AddToken(*repository, *tx, "p1", "write-secret", PermissionTier::kWrite);
    AddToken(*repository, *tx, "p1", "full-secret", PermissionTier::kFull);
    AddToken(*repository, *tx, "p2", "other-secret", PermissionTier::kFull);
    tx->Commit();
  }

  ServiceContext ctx;
  ctx.store         = std::make_shared<lieko::core::DocumentStore>(lieko::core::EngineContext{storage, serializer, registry});
  ctx.registry      = registry;
  ctx.serializer    = serializer;
  ctx.storage       = storage;
  ctx.repository    = repository;
  ctx.authenticator = std::make_shared<lieko::auth::TokenAuthenticator>(repository, kAdmin);
  return ctx;
}

google::protobuf::Struct Json(const std::string& json) {
  google::protobuf::Struct record;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &record);
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

SetRecordRequest SetReq(const std::string& id, const std::string& json) {
  SetRecordRequest req;
  req.set_collection("users");
  req.set_id(id);
  *req.mutable_data() = Json(json);
  return req;
}

void TestTiersGateOperations() {
  DocumentService service(MakeContext());

  assert(CodeOf([&] { service.SetRecord(kRead, SetReq("u1", "{}")); }) == ErrorCode::Forbidden);
  (void)service.SetRecord(kWrite, SetReq("u1", R"({"name":"Bob"})"));

  GetRecordRequest get;
  get.set_collection("users");
  get.set_id("u1");
  assert(service.GetRecord(kRead, get).record().fields().at("name").string_value() == "Bob");

  DeleteRecordRequest del;
  del.set_collection("users");
  del.set_id("u1");
  assert(CodeOf([&] { service.DeleteRecord(kWrite, del); }) == ErrorCode::Forbidden);
  assert(service.DeleteRecord(kFull, del).deleted());
  assert(!service.DeleteRecord(kFull, del).deleted());

  BatchIdsRequest batch;
  batch.set_collection("users");
  batch.add_ids("u1");
  assert(CodeOf([&] { service.BatchDelete(kWrite, batch); }) == ErrorCode::Forbidden);
  assert(service.BatchGet(kRead, batch).errors_size() == 1);

  CollectionRequest drop;
  drop.set_collection("users");
  assert(CodeOf([&] { service.DropCollection(kWrite, drop); }) == ErrorCode::Forbidden);
  service.DropCollection(kFull, drop);
  assert(CodeOf([&] { service.CheckCollection(kRead, drop); }) == ErrorCode::CollectionNotFound);
}

void TestCredentialErrors() {
  DocumentService   service(MakeContext());
  CollectionRequest req;
  req.set_collection("users");

  assert(CodeOf([&] { service.Keys("", req); }) == ErrorCode::NoTokenProvided);
  assert(CodeOf([&] { service.Keys("Bearer nope", req); }) == ErrorCode::InvalidToken);

  req.set_project_id("p2");
  assert(CodeOf([&] { service.Keys(kRead, req); }) == ErrorCode::Forbidden);

  CollectionRequest no_collection;
  assert(CodeOf([&] { service.Keys(kRead, no_collection); }) == ErrorCode::MissingRequiredFields);
}

void TestAdminNamesTheProject() {
  DocumentService service(MakeContext());

  auto req = SetReq("u1", R"({"name":"Ann"})");
  assert(CodeOf([&] { service.SetRecord(kAdmin, req); }) == ErrorCode::MissingRequiredFields);

  req.set_project_id("p2");
  (void)service.SetRecord(kAdmin, req);

  // p2's data is invisible to p1 tokens and visible to p2 tokens
  CollectionRequest size;
  size.set_collection("users");
  assert(CodeOf([&] { service.Size(kRead, size); }) == ErrorCode::CollectionNotFound);
  assert(service.Size(kOther, size).size() == 1);
}

void TestQueryAndSearchResponses() {
  DocumentService service(MakeContext());
  (void)service.SetRecord(kWrite, SetReq("a", R"({"name":"Bob Smith","age":30})"));
  (void)service.SetRecord(kWrite, SetReq("b", R"({"email":"bob@x.com","age":20})"));
  (void)service.SetRecord(kWrite, SetReq("c", R"({"name":"Carl","age":40})"));

  QueryRequest query;
  query.set_collection("users");
  query.set_filter(R"({"age":{"$gte":25}})");
  query.set_sort("age:desc");
  query.set_limit(1);
  auto page = service.Query(kRead, query);
  assert(page.records_size() == 1);
  assert(page.records(0).fields().at("id").string_value() == "c");
  assert(page.page().total_count() == 2);
  assert(page.page().page() == 1);
  assert(page.page().max_page() == 2);

  query.set_filter("{broken");
  assert(CodeOf([&] { service.Query(kRead, query); }) == ErrorCode::InvalidFilter);
  query.set_filter("");
  query.set_sort("age:sideways");
  assert(CodeOf([&] { service.Query(kRead, query); }) == ErrorCode::InvalidRequestBody);

  SearchRequest search;
  search.set_collection("users");
  search.set_term("BOB");
  assert(service.Search(kRead, search).page().total_count() == 2);

  CountRequest count;
  count.set_collection("users");
  assert(service.Count(kRead, count).count() == 3);

  FindOneRequest find;
  find.set_collection("users");
  find.set_filter(R"({"name":"Nobody"})");
  assert(!service.FindOne(kRead, find).found());
}

void TestAdjustDefaultsToOne() {
  DocumentService service(MakeContext());
  (void)service.SetRecord(kWrite, SetReq("u1", R"({"score":10})"));

  AdjustFieldRequest adjust;
  adjust.set_collection("users");
  adjust.set_id("u1");
  adjust.set_field("score");
  assert(service.Increment(kWrite, adjust).record().fields().at("score").number_value() == 11);

  adjust.set_amount(5);
  assert(service.Decrement(kWrite, adjust).record().fields().at("score").number_value() == 6);

  adjust.set_field("missing");
  assert(CodeOf([&] { service.Increment(kWrite, adjust); }) == ErrorCode::InvalidField);
}

} // namespace

int main() {
  TestTiersGateOperations();
  TestCredentialErrors();
  TestAdminNamesTheProject();
  TestQueryAndSearchResponses();
  TestAdjustDefaultsToOne();

  std::cout << "lieko_unit_document_service: pass\n";
  return 0;
}
