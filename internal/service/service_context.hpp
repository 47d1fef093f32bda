#pragma once

#include <memory>

namespace lieko::core {
class DocumentStore;
}
namespace lieko::registry {
class CollectionRegistry;
}
namespace lieko::lock {
class WriteSerializer;
}
namespace lieko::storage {
class StorageBackend;
}
namespace lieko::db {
class Repository;
}
namespace lieko::auth {
class Authenticator;
}

namespace lieko::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<lieko::core::DocumentStore>          store;
  std::shared_ptr<lieko::registry::CollectionRegistry> registry;
  std::shared_ptr<lieko::lock::WriteSerializer>        serializer;
  std::shared_ptr<lieko::storage::StorageBackend>      storage;
  std::shared_ptr<lieko::db::Repository>               repository;
  std::shared_ptr<lieko::auth::Authenticator>          authenticator;
};

} // namespace lieko::service
