#pragma once

#include <grpcpp/grpcpp.h>

#include <string>

namespace lieko::grpc {

inline constexpr const char* kAuthorizationMetadata = "authorization";

// Raw "authorization" metadata value, empty when absent.
inline std::string CredentialFrom(const ::grpc::ServerContext* context) {
  if (!context) return {};

  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find(kAuthorizationMetadata);
  if (it == metadata.end()) return {};
  return std::string(it->second.data(), it->second.size());
}

} // namespace lieko::grpc
