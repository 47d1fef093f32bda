#include "disk_json_store.hpp"

#include <arrow/io/file.h>

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/common/record_codec.hpp"

namespace lieko::storage {

using namespace lieko::storage::common;
using util::ErrorCode;
using util::StorageError;

namespace {

void ThrowIf(const std::error_code& ec, const std::string& what) {
  if (ec) {
    throw StorageError(ErrorCode::FileSystemError, what + ": " + ec.message());
  }
}

} // namespace

DiskJsonStore::DiskJsonStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  ThrowIf(ec, "create storage root " + root_.string());
}

/*
  Read the whole collection document.
*/
model::RecordMap DiskJsonStore::Load(const CollectionRef& ref) {
  const auto path = CollectionPath(root_, ref);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    ThrowIf(ec, "stat " + path.string());
    return {};
  }

  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()), "open " + path.string());
  auto buffer = ReadAll(file, "read " + path.string());
  Unwrap(file->Close(), "close " + path.string());

  return DecodeCollection(std::string_view(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size())),
                          path.string());
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskJsonStore::Persist(const CollectionRef& ref, const model::RecordMap& records) {
  const auto final_path = CollectionPath(root_, ref);
  const auto tmp_path   = final_path.string() + ".tmp";
  const auto document   = EncodeCollection(records);

  std::error_code ec;
  std::filesystem::create_directories(final_path.parent_path(), ec);
  ThrowIf(ec, "create " + final_path.parent_path().string());

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), "open " + tmp_path);
    Unwrap(out->Write(document.data(), static_cast<int64_t>(document.size())), "write " + tmp_path);

    if (fsync_)
      Unwrap(out->Flush(), "flush " + tmp_path);

    Unwrap(out->Close(), "close " + tmp_path);
  }

  std::filesystem::rename(tmp_path, final_path, ec);
  ThrowIf(ec, "rename " + tmp_path);
}

bool DiskJsonStore::Exists(const CollectionRef& ref) {
  std::error_code ec;
  const bool      exists = std::filesystem::exists(CollectionPath(root_, ref), ec);
  ThrowIf(ec, "stat collection " + ref.ResourceKey());
  return exists;
}

void DiskJsonStore::Remove(const CollectionRef& ref) {
  std::error_code ec;
  std::filesystem::remove(CollectionPath(root_, ref), ec);
  ThrowIf(ec, "remove collection " + ref.ResourceKey());
}

void DiskJsonStore::RemoveProject(const std::string& project_id) {
  std::error_code ec;
  std::filesystem::remove_all(ProjectDir(root_, project_id), ec);
  ThrowIf(ec, "remove project " + project_id);
}

} // namespace lieko::storage
