#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/auth/token_authenticator.hpp"
#include "internal/core/document_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/document_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/service/document_service.hpp"
#include "internal/service/project_service.hpp"
#include "internal/storage/ram/ram_store.hpp"
#include "internal/util/errors.hpp"
#include "lieko/v1.hpp"

namespace {

using lieko::util::ErrorCode;

lieko::service::ServiceContext BuildServiceContext() {
  auto storage    = std::make_shared<lieko::storage::RamStore>();
  auto repository = std::make_shared<lieko::db::memory::MemoryRepository>();
  auto serializer = std::make_shared<lieko::lock::WriteSerializer>();
  auto registry   = std::make_shared<lieko::registry::CollectionRegistry>(storage, repository);

  lieko::service::ServiceContext ctx;
  ctx.store         = std::make_shared<lieko::core::DocumentStore>(lieko::core::EngineContext{storage, serializer, registry});
  ctx.registry      = registry;
  ctx.serializer    = serializer;
  ctx.storage       = storage;
  ctx.repository    = repository;
  ctx.authenticator = std::make_shared<lieko::auth::TokenAuthenticator>(repository, "admin-key");
  return ctx;
}

void TestErrorClassesMapToStatusCodes() {
  struct Case {
    ::grpc::Status     status;
    ::grpc::StatusCode code;
    const char*        details;
  };

  const Case cases[] = {
      {lieko::grpc::ToStatus(lieko::util::ValidationError(ErrorCode::InvalidIdFormat, "bad id")), ::grpc::StatusCode::INVALID_ARGUMENT,
       "INVALID_ID_FORMAT"},
      {lieko::grpc::ToStatus(lieko::util::NotFound(ErrorCode::RecordNotFound, "gone")), ::grpc::StatusCode::NOT_FOUND, "RECORD_NOT_FOUND"},
      {lieko::grpc::ToStatus(lieko::util::AlreadyExists(ErrorCode::RecordExists, "dup")), ::grpc::StatusCode::ALREADY_EXISTS, "RECORD_EXISTS"},
      {lieko::grpc::ToStatus(lieko::util::PermissionDenied("no")), ::grpc::StatusCode::PERMISSION_DENIED, "FORBIDDEN"},
      {lieko::grpc::ToStatus(lieko::util::Unauthenticated(ErrorCode::InvalidToken, "who")), ::grpc::StatusCode::UNAUTHENTICATED,
       "INVALID_TOKEN"},
      {lieko::grpc::ToStatus(lieko::util::ResourceExhausted("busy")), ::grpc::StatusCode::RESOURCE_EXHAUSTED, "LOCK_TIMEOUT"},
      {lieko::grpc::ToStatus(lieko::util::StorageError(ErrorCode::FileSystemError, "disk")), ::grpc::StatusCode::INTERNAL,
       "FILE_SYSTEM_ERROR"},
  };

  for (const auto& c : cases) {
    assert(c.status.error_code() == c.code);
    assert(c.status.error_details() == c.details);
  }

  const auto plain = lieko::grpc::ToStatus(std::runtime_error("boom"));
  assert(plain.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(plain.error_message() == "boom");
  assert(plain.error_details().empty());
}

void TestMissingCredentialReturnsUnauthenticated() {
  auto                        ctx     = BuildServiceContext();
  auto                        service = std::make_shared<lieko::service::DocumentService>(ctx);
  lieko::grpc::DocumentServer server(service);

  lieko::v1::GetRecordRequest req;
  req.set_collection("users");
  req.set_id("u1");
  lieko::v1::RecordResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = server.GetRecord(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(status.error_details() == "NO_TOKEN_PROVIDED");
}

void TestProjectServerRejectsAnonymousCreate() {
  auto                       ctx     = BuildServiceContext();
  auto                       service = std::make_shared<lieko::service::ProjectService>(ctx);
  lieko::grpc::ProjectServer server(service);

  lieko::v1::CreateProjectRequest  req;
  lieko::v1::CreateProjectResponse resp;
  req.set_name("shop");
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CreateProject(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(!resp.has_project());
}

} // namespace

int main() {
  TestErrorClassesMapToStatusCodes();
  TestMissingCredentialReturnsUnauthenticated();
  TestProjectServerRejectsAnonymousCreate();

  std::cout << "lieko_unit_grpc_status: pass\n";
  return 0;
}
