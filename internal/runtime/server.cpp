#include "server.hpp"

#include <stdexcept>

#include "internal/grpc/document_server.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/observability/logging.hpp"

namespace lieko::runtime {

Server::Server(std::string bind_address, std::shared_ptr<lieko::service::DocumentService> documents,
               std::shared_ptr<lieko::service::ProjectService> projects)
    : bind_address_(std::move(bind_address)) {
  services_.push_back(std::make_unique<lieko::grpc::DocumentServer>(std::move(documents)));
  services_.push_back(std::make_unique<lieko::grpc::ProjectServer>(std::move(projects)));
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  LIEKO_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace lieko::runtime
