#pragma once

#include <memory>
#include <string>

#include "internal/auth/authenticator.hpp"
#include "internal/db/api/repository.hpp"

namespace lieko::auth {

/*
  Project tokens from the metadata repository, plus the configured
  admin key. Accepts the raw secret or "Bearer <secret>".
*/
class TokenAuthenticator final : public Authenticator {
 public:
  TokenAuthenticator(std::shared_ptr<db::Repository> repository, std::string admin_key);

  AccessGrant Resolve(const std::string& credential) override;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     admin_key_;
};

} // namespace lieko::auth
