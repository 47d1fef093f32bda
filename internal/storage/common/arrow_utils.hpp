#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace lieko::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw StorageError(FILE_SYSTEM_ERROR)
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::string& what) {
  if (!result.ok()) {
    throw util::StorageError(util::ErrorCode::FileSystemError, what + ": " + result.status().ToString());
  }
  return *result;
}

inline void Unwrap(const arrow::Status& status, const std::string& what) {
  if (!status.ok()) {
    throw util::StorageError(util::ErrorCode::FileSystemError, what + ": " + status.ToString());
  }
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& what) {
  auto size = Unwrap(file->GetSize(), what);
  return Unwrap(file->Read(size), what);
}

} // namespace lieko::storage::common
