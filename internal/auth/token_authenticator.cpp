#include "token_authenticator.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace lieko::auth {

using util::ErrorCode;

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

std::string StripBearer(const std::string& credential) {
  if (credential.compare(0, kBearerPrefix.size(), kBearerPrefix) == 0) {
    return credential.substr(kBearerPrefix.size());
  }
  return credential;
}

} // namespace

TokenAuthenticator::TokenAuthenticator(std::shared_ptr<db::Repository> repository, std::string admin_key)
    : repository_(std::move(repository)), admin_key_(std::move(admin_key)) {
}

AccessGrant TokenAuthenticator::Resolve(const std::string& credential) {
  const auto secret = StripBearer(credential);
  if (secret.empty()) {
    throw util::Unauthenticated(ErrorCode::NoTokenProvided, "no token provided");
  }

  AccessGrant grant;
  if (!admin_key_.empty() && secret == admin_key_) {
    grant.admin = true;
    grant.tier  = lieko::model::PermissionTier::kFull;
    return grant;
  }

  auto tx    = repository_->Begin();
  auto token = repository_->FindTokenBySecret(*tx, secret);
  tx->Commit();

  if (!token || !token->active) {
    throw util::Unauthenticated(ErrorCode::InvalidToken, "invalid or inactive token");
  }

  grant.project_id = token->project_id;
  grant.tier       = token->permission;
  return grant;
}

} // namespace lieko::auth
