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

using workbundle::runtime::Server;

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
    std::cerr << "Usage: workbundle-broker <config.yaml> OR workbundle-broker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = workbundle::config::ConfigLoader::LoadFromYaml(config_path);

    workbundle::observability::InitializeLogging(config.logging(), "workbundle-broker");
    workbundle::observability::InitializeTracing(config.observability());

    auto app = workbundle::factory::Build(config);

    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:50061" : config.server().bind_address();
    Server            server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    WORKBUNDLE_LOG_INFO("Work bundle broker started", {workbundle::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    WORKBUNDLE_LOG_INFO("Shutting down work bundle broker");

    server.Stop();
    workbundle::observability::ShutdownTracing();
    workbundle::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    WORKBUNDLE_LOG_ERROR("Fatal error", {workbundle::observability::StringField("error", e.what())});
    workbundle::observability::ShutdownTracing();
    workbundle::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
