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
    std::cerr << "Usage: compiled <config.yaml> OR compiled --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = resource::config::ConfigLoader::LoadFromYaml(config_path);

    resource::observability::InitializeTracing(config, "compiled");
    resource::observability::InitializeMetrics(config, "compiled");
    resource::observability::InitializeLogging(config, "compiled");

    auto app = resource::factory::BuildCompiledDaemon(config);

    Server server(ServerOptions::FromConfig(config.server()), app.dispatcher);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.relay->Start();
    server.Start();
    RESOURCE_LOG_INFO("compiled started", {resource::observability::StringField("bind_address", config.server().bind_address()),
                                           resource::observability::IntField("compiler_version", config.pipeline().compiler_version())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RESOURCE_LOG_INFO("shutting down compiled");

    server.Stop();
    app.relay->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RESOURCE_LOG_ERROR("fatal error", {resource::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
