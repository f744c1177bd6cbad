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

using prdchat::runtime::Server;

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
    std::cerr << "Usage: prd-chat <config.yaml> OR prd-chat --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = prdchat::config::ConfigLoader::LoadFromYaml(config_path);

    prdchat::observability::InitializeTracing(config);
    prdchat::observability::InitializeMetrics(config);
    prdchat::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = prdchat::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PRDCHAT_LOG_INFO("prd-chat started", {prdchat::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PRDCHAT_LOG_INFO("Shutting down prd-chat");

    server.Stop();
    for (auto& worker : app.background_workers) {
      worker->Stop();
    }
    prdchat::observability::ShutdownLogging();
    prdchat::observability::ShutdownMetrics();
    prdchat::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PRDCHAT_LOG_ERROR("Fatal error", {prdchat::observability::StringField("error", e.what())});
    prdchat::observability::ShutdownLogging();
    prdchat::observability::ShutdownMetrics();
    prdchat::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
