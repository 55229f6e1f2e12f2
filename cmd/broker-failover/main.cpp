#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/failover/escape_bridge.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using failover::runtime::Server;

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
    std::cerr << "Usage: broker-failover <config.yaml> OR broker-failover --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = failover::config::ConfigLoader::LoadFromYaml(config_path);

    failover::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = failover::factory::Build(config);

    // ------------------------------------------------------------
    // Start server, then the bridge's inner clients
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.bridge->Start();
    FAILOVER_LOG_INFO("broker started", {failover::observability::StringField("bind_address", config.server().bind_address()),
                                         failover::observability::StringField("broker_name", config.broker().broker_name())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FAILOVER_LOG_INFO("shutting down broker");

    app.bridge->Shutdown();
    server.Stop();
    failover::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FAILOVER_LOG_ERROR("fatal error", {failover::observability::StringField("error", e.what())});
    failover::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
