#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

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
    std::cerr << "Usage: claim-coordinator <config.yaml> OR claim-coordinator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = claims::config::ConfigLoader::LoadFromYaml(config_path);

    claims::observability::InitializeTracing(config);
    claims::observability::InitializeMetrics(config);
    claims::observability::InitializeLogging(config);

    auto app = claims::factory::Build(config);

    // Register signal handlers before starting the cycles to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    CLAIMS_LOG_INFO("claim coordinator started", {claims::observability::BoolField("work_stealing", app.coordinator->Options().enabled),
                                                  claims::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CLAIMS_LOG_INFO("shutting down claim coordinator");

    app.Stop();
    claims::observability::ShutdownLogging();
    claims::observability::ShutdownMetrics();
    claims::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    CLAIMS_LOG_ERROR("fatal error", {claims::observability::StringField("error", e.what())});
    claims::observability::ShutdownLogging();
    claims::observability::ShutdownMetrics();
    claims::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
