#pragma once

#include <string>

#include "internal/auth/access.hpp"

namespace lieko::auth {

/*
  Resolves a caller credential into an AccessGrant.

  Throws Unauthenticated(NO_TOKEN_PROVIDED) for an empty credential and
  Unauthenticated(INVALID_TOKEN) for one that is unknown or inactive.
*/
class Authenticator {
 public:
  virtual ~Authenticator() = default;

  virtual AccessGrant Resolve(const std::string& credential) = 0;
};

} // namespace lieko::auth
