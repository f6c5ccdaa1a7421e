#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using ainp::factory::Build;
using ainp::observability::StringField;
using ainp::observability::UIntField;

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
    std::cerr << "Usage: ainp-broker <config.yaml> OR ainp-broker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ainp::config::ConfigLoader::LoadFromYaml(config_path);

    ainp::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting background work.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.maintenance->Start();
    AINP_LOG_INFO("AINP broker core started",
                  {StringField("config", config_path), StringField("broker_did", app.options.broker_did),
                   UIntField("expiry_interval_ms", static_cast<uint64_t>(app.options.expiry_interval.count())),
                   UIntField("reconcile_interval_ms", static_cast<uint64_t>(app.options.reconcile_interval.count()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    AINP_LOG_INFO("Shutting down AINP broker core");

    app.maintenance->Stop();
    ainp::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    AINP_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ainp::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
