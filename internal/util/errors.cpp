#include "errors.hpp"

namespace lieko::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidRequestBody:
      return "INVALID_REQUEST_BODY";
    case ErrorCode::InvalidIdFormat:
      return "INVALID_ID_FORMAT";
    case ErrorCode::InvalidFilter:
      return "INVALID_FILTER";
    case ErrorCode::InvalidField:
      return "INVALID_FIELD";
    case ErrorCode::MissingRequiredFields:
      return "MISSING_REQUIRED_FIELDS";
    case ErrorCode::InvalidProjectName:
      return "INVALID_PROJECT_NAME";
    case ErrorCode::InvalidTokenPermissions:
      return "INVALID_TOKEN_PERMISSIONS";
    case ErrorCode::ProjectNotFound:
      return "PROJECT_NOT_FOUND";
    case ErrorCode::CollectionNotFound:
      return "COLLECTION_NOT_FOUND";
    case ErrorCode::RecordNotFound:
      return "RECORD_NOT_FOUND";
    case ErrorCode::TokenNotFound:
      return "TOKEN_NOT_FOUND";
    case ErrorCode::RecordExists:
      return "RECORD_EXISTS";
    case ErrorCode::FileSystemError:
      return "FILE_SYSTEM_ERROR";
    case ErrorCode::JsonParsingError:
      return "JSON_PARSING_ERROR";
    case ErrorCode::DatabaseError:
      return "DATABASE_ERROR";
    case ErrorCode::NoTokenProvided:
      return "NO_TOKEN_PROVIDED";
    case ErrorCode::InvalidToken:
      return "INVALID_TOKEN";
    case ErrorCode::Forbidden:
      return "FORBIDDEN";
    case ErrorCode::LockTimeout:
      return "LOCK_TIMEOUT";
  }
  return "INTERNAL_ERROR";
}

} // namespace lieko::util
