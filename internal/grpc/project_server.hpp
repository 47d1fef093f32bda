#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/project_service.hpp"
#include "lieko/v1/project_service.grpc.pb.h"

namespace lieko::grpc {

class ProjectServer final : public lieko::v1::ProjectService::Service {
 public:
  explicit ProjectServer(std::shared_ptr<lieko::service::ProjectService> svc);

  ::grpc::Status CreateProject(::grpc::ServerContext*, const lieko::v1::CreateProjectRequest*, lieko::v1::CreateProjectResponse*) override;
  ::grpc::Status GetProject(::grpc::ServerContext*, const lieko::v1::ProjectRequest*, lieko::v1::Project*) override;
  ::grpc::Status ListProjects(::grpc::ServerContext*, const lieko::v1::ListProjectsRequest*, lieko::v1::ListProjectsResponse*) override;
  ::grpc::Status DeleteProject(::grpc::ServerContext*, const lieko::v1::ProjectRequest*, google::protobuf::Empty*) override;
  ::grpc::Status ListCollections(::grpc::ServerContext*, const lieko::v1::ProjectRequest*, lieko::v1::ListCollectionsResponse*) override;
  ::grpc::Status RegisterCollections(::grpc::ServerContext*, const lieko::v1::CollectionNamesRequest*, lieko::v1::ListCollectionsResponse*) override;
  ::grpc::Status DropCollections(::grpc::ServerContext*, const lieko::v1::CollectionNamesRequest*, lieko::v1::ListCollectionsResponse*) override;
  ::grpc::Status CreateToken(::grpc::ServerContext*, const lieko::v1::CreateTokenRequest*, lieko::v1::Token*) override;
  ::grpc::Status ListTokens(::grpc::ServerContext*, const lieko::v1::ProjectRequest*, lieko::v1::ListTokensResponse*) override;
  ::grpc::Status DeleteToken(::grpc::ServerContext*, const lieko::v1::DeleteTokenRequest*, google::protobuf::Empty*) override;
  ::grpc::Status ValidateToken(::grpc::ServerContext*, const lieko::v1::ValidateTokenRequest*, lieko::v1::ValidateTokenResponse*) override;

 private:
  std::shared_ptr<lieko::service::ProjectService> service_;
};

} // namespace lieko::grpc
