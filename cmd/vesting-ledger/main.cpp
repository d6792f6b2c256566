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

using vesting::factory::Build;
using vesting::runtime::Server;

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
    std::cerr << "Usage: vesting-ledger <config.yaml> OR vesting-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vesting::config::ConfigLoader::LoadFromYaml(config_path);
    vesting::config::ConfigLoader::Validate(config);

    vesting::observability::InitializeTracing(config);
    vesting::observability::InitializeMetrics(config);
    vesting::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    VESTING_LOG_INFO("Vesting ledger started", {vesting::observability::StringField("bind_address", config.server().bind_address()),
                                                vesting::observability::StringField("engine_address", config.ledger().engine_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VESTING_LOG_INFO("Shutting down vesting ledger");

    server.Stop();
    vesting::observability::ShutdownLogging();
    vesting::observability::ShutdownMetrics();
    vesting::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    VESTING_LOG_ERROR("Fatal error", {vesting::observability::StringField("error", e.what())});
    vesting::observability::ShutdownLogging();
    vesting::observability::ShutdownMetrics();
    vesting::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
