#pragma once

#include <string>

#include "lieko/v1.hpp"
#include "service_context.hpp"

namespace lieko::service {

/*
  Project, collection-membership and token administration.

  CreateProject, ListProjects and DeleteProject require the admin key.
  The other calls also accept a full token of the target project, and
  ValidateToken accepts any valid credential.
*/
class ProjectService {
 public:
  explicit ProjectService(ServiceContext ctx);

  lieko::v1::CreateProjectResponse CreateProject(const std::string& credential, const lieko::v1::CreateProjectRequest& req);
  lieko::v1::Project               GetProject(const std::string& credential, const lieko::v1::ProjectRequest& req);
  lieko::v1::ListProjectsResponse  ListProjects(const std::string& credential, const lieko::v1::ListProjectsRequest& req);
  void                             DeleteProject(const std::string& credential, const lieko::v1::ProjectRequest& req);

  lieko::v1::ListCollectionsResponse ListCollections(const std::string& credential, const lieko::v1::ProjectRequest& req);
  lieko::v1::ListCollectionsResponse RegisterCollections(const std::string& credential, const lieko::v1::CollectionNamesRequest& req);
  lieko::v1::ListCollectionsResponse DropCollections(const std::string& credential, const lieko::v1::CollectionNamesRequest& req);

  lieko::v1::Token              CreateToken(const std::string& credential, const lieko::v1::CreateTokenRequest& req);
  lieko::v1::ListTokensResponse ListTokens(const std::string& credential, const lieko::v1::ProjectRequest& req);
  void                          DeleteToken(const std::string& credential, const lieko::v1::DeleteTokenRequest& req);

  lieko::v1::ValidateTokenResponse ValidateToken(const std::string& credential, const lieko::v1::ValidateTokenRequest& req);

 private:
  lieko::v1::Project LoadProject(const std::string& project_id);

  ServiceContext ctx_;
};

} // namespace lieko::service
