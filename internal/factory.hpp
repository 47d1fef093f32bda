#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/document_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/document_service.hpp"
#include "internal/service/project_service.hpp"
#include "internal/service/service_context.hpp"

namespace lieko::factory {

/*
  Application

  Owns all long-lived components of one server instance.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  lieko::core::EngineContext                     engine;
  std::shared_ptr<lieko::db::Repository>         repository;
  std::shared_ptr<lieko::core::DocumentStore>    store;
  std::shared_ptr<lieko::service::DocumentService> document_service;
  std::shared_ptr<lieko::service::ProjectService>  project_service;
};

/*
  Build

  Constructs the entire backend from runtime config.

  This is the composition root of the application and the only place
  that knows concrete storage and database types.
*/
Application Build(const lieko::runtime::config::RuntimeConfig& config);

} // namespace lieko::factory
