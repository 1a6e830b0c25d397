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

using routebid::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  routebid::observability::ShutdownLogging();
  routebid::observability::ShutdownMetrics();
  routebid::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: routebid <config.yaml> OR routebid --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = routebid::config::ConfigLoader::LoadFromYaml(config_path);

    routebid::observability::InitializeTracing(config);
    routebid::observability::InitializeMetrics(config);
    routebid::observability::InitializeLogging(config);

    auto app = routebid::factory::Build(config);

    const std::string bind_address =
        config.server().bind_address().empty() ? routebid::config::kDefaultBindAddress : config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (!config.scheduler().disabled()) {
      app.scheduler->Start();
    }
    ROUTEBID_LOG_INFO("routebid started", {routebid::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROUTEBID_LOG_INFO("shutting down routebid");

    app.scheduler->Stop();
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ROUTEBID_LOG_ERROR("Fatal error", {routebid::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
