#include "project_server.hpp"

#include "auth_metadata.hpp"
#include "grpc_error.hpp"

namespace lieko::grpc {

using namespace lieko::v1;

ProjectServer::ProjectServer(std::shared_ptr<lieko::service::ProjectService> svc) : service_(std::move(svc)) {
}

::grpc::Status ProjectServer::CreateProject(::grpc::ServerContext* context, const CreateProjectRequest* req, CreateProjectResponse* resp) {
  try {
    *resp = service_->CreateProject(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::GetProject(::grpc::ServerContext* context, const ProjectRequest* req, Project* resp) {
  try {
    *resp = service_->GetProject(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ListProjects(::grpc::ServerContext* context, const ListProjectsRequest* req, ListProjectsResponse* resp) {
  try {
    *resp = service_->ListProjects(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::DeleteProject(::grpc::ServerContext* context, const ProjectRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteProject(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ListCollections(::grpc::ServerContext* context, const ProjectRequest* req, ListCollectionsResponse* resp) {
  try {
    *resp = service_->ListCollections(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::RegisterCollections(::grpc::ServerContext* context, const CollectionNamesRequest* req, ListCollectionsResponse* resp) {
  try {
    *resp = service_->RegisterCollections(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::DropCollections(::grpc::ServerContext* context, const CollectionNamesRequest* req, ListCollectionsResponse* resp) {
  try {
    *resp = service_->DropCollections(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::CreateToken(::grpc::ServerContext* context, const CreateTokenRequest* req, Token* resp) {
  try {
    *resp = service_->CreateToken(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ListTokens(::grpc::ServerContext* context, const ProjectRequest* req, ListTokensResponse* resp) {
  try {
    *resp = service_->ListTokens(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::DeleteToken(::grpc::ServerContext* context, const DeleteTokenRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteToken(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ValidateToken(::grpc::ServerContext* context, const ValidateTokenRequest* req, ValidateTokenResponse* resp) {
  try {
    *resp = service_->ValidateToken(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace lieko::grpc
