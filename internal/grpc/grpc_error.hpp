#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace lieko::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  util::Error subclasses carry their stable code name in the status
  error details, e.g. "RECORD_NOT_FOUND".
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace lieko::grpc
