#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using lieko::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: liekodb <config.yaml> OR liekodb --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = lieko::config::ConfigLoader::LoadFromYaml(config_path);

    lieko::observability::InitializeTracing(config);
    lieko::observability::InitializeMetrics(config);
    lieko::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = lieko::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), app.document_service, app.project_service);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LIEKO_LOG_INFO("LiekoDB started", {lieko::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LIEKO_LOG_INFO("Shutting down LiekoDB");

    server.Stop();
    lieko::observability::ShutdownLogging();
    lieko::observability::ShutdownMetrics();
    lieko::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    LIEKO_LOG_ERROR("Fatal error", {lieko::observability::StringField("error", e.what())});
    lieko::observability::ShutdownLogging();
    lieko::observability::ShutdownMetrics();
    lieko::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
