#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace lieko::util {

/*
  Central error types.

  Every error carries a stable machine code next to its message.
  The transport translates the class into a status code and sends
  the code name as error details.
*/

enum class ErrorCode {
  InvalidRequestBody,
  InvalidIdFormat,
  InvalidFilter,
  InvalidField,
  MissingRequiredFields,
  InvalidProjectName,
  InvalidTokenPermissions,

  ProjectNotFound,
  CollectionNotFound,
  RecordNotFound,
  TokenNotFound,

  RecordExists,

  FileSystemError,
  JsonParsingError,
  DatabaseError,

  NoTokenProvided,
  InvalidToken,
  Forbidden,

  LockTimeout
};

// e.g. "INVALID_ID_FORMAT"
std::string_view ErrorCodeName(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode Code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

class ValidationError : public Error {
 public:
  ValidationError(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class NotFound : public Error {
 public:
  NotFound(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class AlreadyExists : public Error {
 public:
  AlreadyExists(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class StorageError : public Error {
 public:
  StorageError(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class Unauthenticated : public Error {
 public:
  Unauthenticated(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class PermissionDenied : public Error {
 public:
  explicit PermissionDenied(const std::string& msg) : Error(ErrorCode::Forbidden, msg) {
  }
};

class ResourceExhausted : public Error {
 public:
  explicit ResourceExhausted(const std::string& msg) : Error(ErrorCode::LockTimeout, msg) {
  }
};

} // namespace lieko::util
