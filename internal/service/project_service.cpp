#include "project_service.hpp"

#include "internal/auth/authenticator.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/write_serializer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/collection_registry.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace lieko::service {

using namespace lieko::v1;
using lieko::model::PermissionTier;
using util::ErrorCode;

namespace {

CollectionInfo ToCollectionInfo(const db::model::CollectionRecord& record) {
  CollectionInfo info;
  info.set_name(record.name);
  info.set_created_at(util::ToIso8601(record.created_at_ms));
  info.set_updated_at(util::ToIso8601(record.updated_at_ms));
  return info;
}

Token ToToken(const db::model::TokenRecord& record) {
  Token token;
  token.set_id(record.id);
  token.set_project_id(record.project_id);
  token.set_name(record.name);
  token.set_secret(record.secret);
  token.set_permission(std::string(lieko::model::ToString(record.permission)));
  token.set_active(record.active);
  token.set_created_at(util::ToIso8601(record.created_at_ms));
  return token;
}

Project ToProject(const db::model::ProjectRecord& record, const std::vector<db::model::CollectionRecord>& collections) {
  Project project;
  project.set_id(record.id);
  project.set_name(record.name);
  project.set_description(record.description);
  project.set_owner_id(record.owner_id);
  project.set_created_at(util::ToIso8601(record.created_at_ms));
  project.set_updated_at(util::ToIso8601(record.updated_at_ms));
  for (const auto& c : collections) {
    *project.add_collections() = ToCollectionInfo(c);
  }
  return project;
}

ListCollectionsResponse ToListCollections(const std::vector<db::model::CollectionRecord>& collections) {
  ListCollectionsResponse resp;
  for (const auto& c : collections) {
    *resp.add_collections() = ToCollectionInfo(c);
  }
  return resp;
}

// Resolves the target project and checks the caller may administer it.
std::string AuthorizeProject(const ServiceContext& ctx, const std::string& credential, const std::string& requested) {
  const auto grant      = ctx.authenticator->Resolve(credential);
  const auto project_id = auth::ResolveProject(grant, requested);
  auth::RequireProjectAdmin(grant, project_id);
  return project_id;
}

db::model::TokenRecord MintToken(const std::string& project_id, const std::string& name, PermissionTier tier, uint64_t now_ms) {
  db::model::TokenRecord token;
  token.id            = util::ToString(util::GenerateUUID());
  token.project_id    = project_id;
  token.name          = name;
  token.secret        = util::GenerateSecret();
  token.permission    = tier;
  token.active        = true;
  token.created_at_ms = now_ms;
  return token;
}

} // namespace

ProjectService::ProjectService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Project ProjectService::LoadProject(const std::string& project_id) {
  auto tx      = ctx_.repository->Begin();
  auto project = ctx_.repository->GetProject(*tx, project_id);
  if (!project) {
    throw util::NotFound(ErrorCode::ProjectNotFound, "project '" + project_id + "' not found");
  }
  auto collections = ctx_.repository->ListCollections(*tx, project_id);
  tx->Commit();
  return ToProject(*project, collections);
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

CreateProjectResponse ProjectService::CreateProject(const std::string& credential, const CreateProjectRequest& req) {
  return ObserveRpc("ProjectService.CreateProject", req.name(), [&] {
    auth::RequireAdmin(ctx_.authenticator->Resolve(credential));
    if (req.name().empty()) {
      throw util::ValidationError(ErrorCode::InvalidProjectName, "project name is required");
    }

    const auto now = util::ToUnixMillis(util::Now());

    db::model::ProjectRecord project;
    project.id            = util::ToString(util::GenerateUUID());
    project.name          = req.name();
    project.description   = req.description();
    project.owner_id      = req.owner_id();
    project.created_at_ms = now;
    project.updated_at_ms = now;

    const auto token = MintToken(project.id, "default", PermissionTier::kFull, now);

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertProject(*tx, project), "insert project");
    db::ThrowIfDbError(ctx_.repository->InsertToken(*tx, token), "insert token");
    tx->Commit();

    LIEKO_LOG_INFO("Project created", {observability::StringField("project_id", project.id), observability::StringField("name", project.name)});

    CreateProjectResponse resp;
    *resp.mutable_project() = ToProject(project, {});
    *resp.mutable_token()   = ToToken(token);
    return resp;
  });
}

Project ProjectService::GetProject(const std::string& credential, const ProjectRequest& req) {
  return ObserveRpc("ProjectService.GetProject", req.project_id(), [&] {
    return LoadProject(AuthorizeProject(ctx_, credential, req.project_id()));
  });
}

ListProjectsResponse ProjectService::ListProjects(const std::string& credential, const ListProjectsRequest&) {
  return ObserveRpc("ProjectService.ListProjects", "", [&] {
    auth::RequireAdmin(ctx_.authenticator->Resolve(credential));

    ListProjectsResponse resp;
    auto                 tx = ctx_.repository->Begin();
    for (const auto& project : ctx_.repository->ListProjects(*tx)) {
      *resp.add_projects() = ToProject(project, ctx_.repository->ListCollections(*tx, project.id));
    }
    tx->Commit();
    return resp;
  });
}

void ProjectService::DeleteProject(const std::string& credential, const ProjectRequest& req) {
  ObserveRpc("ProjectService.DeleteProject", req.project_id(), [&] {
    auth::RequireAdmin(ctx_.authenticator->Resolve(credential));
    if (req.project_id().empty()) {
      throw util::ValidationError(ErrorCode::MissingRequiredFields, "project_id is required");
    }

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->DeleteProject(*tx, req.project_id()), "delete project " + req.project_id());
    tx->Commit();

    ctx_.registry->ForgetProject(req.project_id());
    ctx_.storage->RemoveProject(req.project_id());

    LIEKO_LOG_INFO("Project deleted", {observability::StringField("project_id", req.project_id())});
  });
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

ListCollectionsResponse ProjectService::ListCollections(const std::string& credential, const ProjectRequest& req) {
  return ObserveRpc("ProjectService.ListCollections", req.project_id(), [&] {
    const auto project_id = AuthorizeProject(ctx_, credential, req.project_id());
    LoadProject(project_id);
    return ToListCollections(ctx_.registry->List(project_id));
  });
}

ListCollectionsResponse ProjectService::RegisterCollections(const std::string& credential, const CollectionNamesRequest& req) {
  return ObserveRpc("ProjectService.RegisterCollections", req.project_id(), [&] {
    const auto project_id = AuthorizeProject(ctx_, credential, req.project_id());
    if (req.names().empty()) {
      throw util::ValidationError(ErrorCode::MissingRequiredFields, "names must not be empty");
    }

    ctx_.registry->Register(project_id, std::vector<std::string>(req.names().begin(), req.names().end()));
    return ToListCollections(ctx_.registry->List(project_id));
  });
}

ListCollectionsResponse ProjectService::DropCollections(const std::string& credential, const CollectionNamesRequest& req) {
  return ObserveRpc("ProjectService.DropCollections", req.project_id(), [&] {
    const auto project_id = AuthorizeProject(ctx_, credential, req.project_id());
    if (req.names().empty()) {
      throw util::ValidationError(ErrorCode::MissingRequiredFields, "names must not be empty");
    }
    LoadProject(project_id);

    for (const auto& name : req.names()) {
      const storage::CollectionRef ref{project_id, name};
      auto                         guard = ctx_.serializer->Acquire(ref.ResourceKey());
      ctx_.registry->Drop(ref);
    }
    return ToListCollections(ctx_.registry->List(project_id));
  });
}

// ------------------------------------------------------------------
// Tokens
// ------------------------------------------------------------------

Token ProjectService::CreateToken(const std::string& credential, const CreateTokenRequest& req) {
  return ObserveRpc("ProjectService.CreateToken", req.project_id(), [&] {
    const auto project_id = AuthorizeProject(ctx_, credential, req.project_id());

    const auto tier = lieko::model::ParsePermissionTier(req.permission());
    if (!tier) {
      throw util::ValidationError(ErrorCode::InvalidTokenPermissions, "permission must be read, write or full");
    }

    const auto token = MintToken(project_id, req.name(), *tier, util::ToUnixMillis(util::Now()));

    auto tx = ctx_.repository->Begin();
    if (!ctx_.repository->GetProject(*tx, project_id)) {
      throw util::NotFound(ErrorCode::ProjectNotFound, "project '" + project_id + "' not found");
    }
    db::ThrowIfDbError(ctx_.repository->InsertToken(*tx, token), "insert token");
    tx->Commit();

    return ToToken(token);
  });
}

ListTokensResponse ProjectService::ListTokens(const std::string& credential, const ProjectRequest& req) {
  return ObserveRpc("ProjectService.ListTokens", req.project_id(), [&] {
    const auto project_id = AuthorizeProject(ctx_, credential, req.project_id());

    ListTokensResponse resp;
    auto               tx = ctx_.repository->Begin();
    for (const auto& token : ctx_.repository->ListTokens(*tx, project_id)) {
      *resp.add_tokens() = ToToken(token);
    }
    tx->Commit();
    return resp;
  });
}

void ProjectService::DeleteToken(const std::string& credential, const DeleteTokenRequest& req) {
  ObserveRpc("ProjectService.DeleteToken", req.project_id(), [&] {
    const auto project_id = AuthorizeProject(ctx_, credential, req.project_id());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->DeleteToken(*tx, project_id, req.token_id()), "delete token " + req.token_id(),
                       ErrorCode::TokenNotFound);
    tx->Commit();
  });
}

ValidateTokenResponse ProjectService::ValidateToken(const std::string& credential, const ValidateTokenRequest&) {
  return ObserveRpc("ProjectService.ValidateToken", "", [&] {
    const auto grant = ctx_.authenticator->Resolve(credential);

    ValidateTokenResponse resp;
    if (grant.admin) {
      resp.set_permission("admin");
      return resp;
    }
    *resp.mutable_project() = LoadProject(grant.project_id);
    resp.set_permission(std::string(lieko::model::ToString(grant.tier)));
    return resp;
  });
}

} // namespace lieko::service
