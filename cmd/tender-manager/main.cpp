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

using tender::factory::Build;
using tender::runtime::Server;

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
    std::cerr << "Usage: tender-manager <config.yaml> OR tender-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tender::config::ConfigLoader::LoadFromYaml(config_path);

    tender::observability::InitializeTracing(config);
    tender::observability::InitializeMetrics(config);
    tender::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = tender::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TENDER_LOG_INFO("Tender Manager started", {tender::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TENDER_LOG_INFO("Shutting down tender manager");

    server.Stop();
    tender::observability::ShutdownLogging();
    tender::observability::ShutdownMetrics();
    tender::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TENDER_LOG_ERROR("Fatal error", {tender::observability::StringField("error", e.what())});
    tender::observability::ShutdownLogging();
    tender::observability::ShutdownMetrics();
    tender::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
