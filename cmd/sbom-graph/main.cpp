#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/analysis_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using sbomgraph::runtime::Server;

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
    std::cerr << "Usage: sbom-graph <config.yaml> OR sbom-graph --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sbomgraph::config::ConfigLoader::LoadFromYaml(config_path);

    sbomgraph::observability::InitializeTracing(config.observability());
    sbomgraph::observability::InitializeMetrics(config.observability());
    sbomgraph::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = sbomgraph::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<sbomgraph::grpc::AnalysisServer>(app.graph_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SBOMGRAPH_LOG_INFO("sbom-graph started", {sbomgraph::observability::IntField("port", server.Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SBOMGRAPH_LOG_INFO("Shutting down sbom-graph");

    server.Stop();
    sbomgraph::observability::ShutdownLogging();
    sbomgraph::observability::ShutdownMetrics();
    sbomgraph::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SBOMGRAPH_LOG_ERROR("Fatal error", {sbomgraph::observability::StringField("error", e.what())});
    sbomgraph::observability::ShutdownLogging();
    sbomgraph::observability::ShutdownMetrics();
    sbomgraph::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
