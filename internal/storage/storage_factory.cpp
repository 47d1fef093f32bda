#include "storage_factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "ram/ram_store.hpp"
#if LIEKO_STORAGE_ARROW
#include "disk/disk_json_store.hpp"
#endif

namespace lieko::storage {

StorageBackendPtr StorageFactory::Build(const lieko::runtime::config::StorageConfig& cfg) {
  if (cfg.has_ram()) {
    return std::make_shared<RamStore>();
  }

#if LIEKO_STORAGE_ARROW
  std::filesystem::path disk_root =
      cfg.disk().root_path().empty() ? std::filesystem::path{"./data/collections"} : std::filesystem::path{cfg.disk().root_path()};
  return std::make_shared<DiskJsonStore>(std::move(disk_root), cfg.disk().fsync());
#else
  throw std::runtime_error("disk storage requested but not enabled at build time");
#endif
}

} // namespace lieko::storage
