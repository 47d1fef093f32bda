#pragma once

#include <memory>

#include "internal/lock/write_serializer.hpp"
#include "internal/registry/collection_registry.hpp"
#include "internal/storage/storage_backend.hpp"

namespace lieko::core {

/*
  Shared engine state of one running server.

  Built once by the factory and handed to every component that reads
  or writes collections; nothing here is a process-wide singleton.
*/
struct EngineContext {
  storage::StorageBackendPtr                    storage;
  std::shared_ptr<lock::WriteSerializer>        serializer;
  std::shared_ptr<registry::CollectionRegistry> registry;
};

} // namespace lieko::core
