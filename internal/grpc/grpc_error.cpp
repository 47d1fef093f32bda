#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace lieko::grpc {

namespace {

::grpc::StatusCode StatusCodeFor(const util::Error& e) {
  using namespace lieko::util;

  if (dynamic_cast<const ValidationError*>(&e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (dynamic_cast<const NotFound*>(&e)) return ::grpc::StatusCode::NOT_FOUND;
  if (dynamic_cast<const AlreadyExists*>(&e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (dynamic_cast<const PermissionDenied*>(&e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (dynamic_cast<const Unauthenticated*>(&e)) return ::grpc::StatusCode::UNAUTHENTICATED;
  if (dynamic_cast<const ResourceExhausted*>(&e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* error = dynamic_cast<const util::Error*>(&e)) {
    return {StatusCodeFor(*error), error->what(), std::string(util::ErrorCodeName(error->Code()))};
  }
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace lieko::grpc
