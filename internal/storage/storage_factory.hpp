#pragma once

#include "config/config.pb.h"
#include "storage_backend.hpp"

namespace lieko::storage {

/*
  Builds the collection storage backend from configuration.
*/

class StorageFactory {
 public:
  static StorageBackendPtr Build(const lieko::runtime::config::StorageConfig& cfg);
};

} // namespace lieko::storage
