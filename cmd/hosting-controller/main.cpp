#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provisioning/provisioning_store.hpp"
#include "internal/proxy/proxy_watchdog.hpp"
#include "internal/redirect/redirect_sweeper.hpp"
#include "internal/runtime/server.hpp"

using hosting::factory::Build;
using hosting::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults only
  } else if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: hosting-controller [<config.yaml>] OR hosting-controller --config <config.yaml>" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? hosting::config::ConfigLoader::Defaults() : hosting::config::ConfigLoader::LoadFromYaml(config_path);

    hosting::observability::InitializeLogging(config);
    hosting::observability::InitializeTracing(config);
    hosting::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting anything to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGPIPE, SIG_IGN);

    // ------------------------------------------------------------
    // Start proxy, workers and server
    // ------------------------------------------------------------
    app.store->Start();
    app.sweeper->Start();
    app.watchdog->Start();

    Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    HOSTING_LOG_INFO("Hosting controller started", {hosting::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running && !app.watchdog->Fatal()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    if (app.watchdog->Fatal()) {
      HOSTING_LOG_ERROR("Proxy supervision gave up, exiting");
      exit_code = 1;
    } else {
      HOSTING_LOG_INFO("Shutting down hosting controller");
    }

    server.Stop();
    app.watchdog->Stop();
    app.sweeper->Stop();
    app.store->Shutdown();
    hosting::observability::ShutdownMetrics();
    hosting::observability::ShutdownTracing();
    hosting::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    HOSTING_LOG_ERROR("Fatal error", {hosting::observability::StringField("error", e.what())});
    hosting::observability::ShutdownMetrics();
    hosting::observability::ShutdownTracing();
    hosting::observability::ShutdownLogging();
    return 2;
  }

  return exit_code;
}
