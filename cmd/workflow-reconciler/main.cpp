#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/manifest_source.hpp"

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
    std::cerr << "Usage: workflow-reconciler <config.yaml> OR workflow-reconciler --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = reconciler::config::ConfigLoader::LoadFromYaml(config_path);

    reconciler::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = reconciler::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    RECONCILER_LOG_INFO("Workflow reconciler started",
                        {reconciler::observability::StringField("workflows_root", config.workflows().root()),
                         reconciler::observability::IntField("threads", app.workers->Size()),
                         reconciler::observability::BoolField("support_pause", config.workflows().support_pause())});

    if (!config.manifest().path().empty()) {
      reconciler::source::EnqueueManifest(config.manifest().path(), *app.queue);
    }

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RECONCILER_LOG_INFO("Shutting down workflow reconciler");

    app.Stop();
    reconciler::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RECONCILER_LOG_ERROR("Fatal error", {reconciler::observability::StringField("error", e.what())});
    reconciler::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
