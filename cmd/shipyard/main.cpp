#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/deploy/status_poller.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using shipyard::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  shipyard::observability::ShutdownLogging();
  shipyard::observability::ShutdownMetrics();
  shipyard::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: shipyard <config.yaml> OR shipyard --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = shipyard::config::ConfigLoader::LoadFromYaml(config_path);

    shipyard::observability::InitializeTracing(config);
    shipyard::observability::InitializeMetrics(config);
    shipyard::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = shipyard::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SHIPYARD_LOG_INFO("shipyard started", {shipyard::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SHIPYARD_LOG_INFO("shutting down shipyard");

    for (auto& worker : app.background_workers) {
      worker->Stop();
    }
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    SHIPYARD_LOG_ERROR("Fatal error", {shipyard::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
