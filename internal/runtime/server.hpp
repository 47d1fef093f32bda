#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>
#include <vector>

namespace lieko::service {
class DocumentService;
class ProjectService;
} // namespace lieko::service

namespace lieko::runtime {

/*
  gRPC server hosting DocumentService and ProjectService.
*/
class Server {
 public:
  Server(std::string bind_address, std::shared_ptr<lieko::service::DocumentService> documents,
         std::shared_ptr<lieko::service::ProjectService> projects);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
};

} // namespace lieko::runtime
