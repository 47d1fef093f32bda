#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/auth/token_authenticator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/write_serializer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/collection_registry.hpp"
#include "internal/storage/storage_factory.hpp"
#if LIEKO_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace lieko::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const lieko::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LIEKO_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    LIEKO_LOG_INFO("Metadata database opened", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite metadata database requested but not enabled at build time");
#endif
  }

  LIEKO_LOG_WARN("Using in-memory metadata database; projects and tokens are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const lieko::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  app.engine.storage    = storage::StorageFactory::Build(config.storage());
  app.engine.serializer = std::make_shared<lock::WriteSerializer>(std::chrono::milliseconds(config.locks().write_timeout_ms()));
  app.engine.registry   = std::make_shared<registry::CollectionRegistry>(app.engine.storage, app.repository);
  app.engine.registry->Hydrate();

  app.store = std::make_shared<core::DocumentStore>(app.engine);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store         = app.store;
  ctx.registry      = app.engine.registry;
  ctx.serializer    = app.engine.serializer;
  ctx.storage       = app.engine.storage;
  ctx.repository    = app.repository;
  ctx.authenticator = std::make_shared<auth::TokenAuthenticator>(app.repository, config.auth().admin_key());

  if (config.auth().admin_key().empty()) {
    LIEKO_LOG_WARN("No admin key configured; project administration is disabled");
  }

  app.document_service = std::make_shared<service::DocumentService>(ctx);
  app.project_service  = std::make_shared<service::ProjectService>(ctx);

  LIEKO_LOG_INFO("Engine built", {observability::StringField("storage", app.engine.storage->Name()),
                                  observability::IntField("write_timeout_ms", config.locks().write_timeout_ms())});
  return app;
}

} // namespace lieko::factory
