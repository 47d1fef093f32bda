#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace lieko::db {

/*
  Converts a repository Result into the service error taxonomy.

  NotFound results take the caller's code since only the caller knows
  which entity was looked up. Everything else is a database failure.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context,
                           util::ErrorCode not_found_code = util::ErrorCode::ProjectNotFound) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(not_found_code, message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Busy:
    case ErrorCode::ConstraintViolation:
    case ErrorCode::IOError:
    case ErrorCode::Corruption:
    default:
      throw util::StorageError(util::ErrorCode::DatabaseError, message);
  }
}

} // namespace lieko::db
