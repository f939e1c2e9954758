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

using resource::runtime::Server;
using resource::runtime::ServerOptions;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  resource::observability::ShutdownLogging();
  resource::observability::ShutdownMetrics();
  resource::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: sourced <config.yaml> OR sourced --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = resource::config::ConfigLoader::LoadFromYaml(config_path);

    resource::observability::InitializeTracing(config, "sourced");
    resource::observability::InitializeMetrics(config, "sourced");
    resource::observability::InitializeLogging(config, "sourced");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = resource::factory::BuildSourceDaemon(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(ServerOptions::FromConfig(config.server()), app.dispatcher);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RESOURCE_LOG_INFO("sourced started", {resource::observability::StringField("bind_address", config.server().bind_address()),
                                          resource::observability::StringField("root_path", config.source().local().root_path())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RESOURCE_LOG_INFO("shutting down sourced");

    server.Stop();
    app.stack.bus->CloseAll();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RESOURCE_LOG_ERROR("fatal error", {resource::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
