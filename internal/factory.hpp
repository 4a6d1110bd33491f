#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/analysis/analysis_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/graph_service.hpp"

namespace sbomgraph::factory {

/*
  Application

  Repository, analysis engine (graph cache and expansion pool) and the
  transport-neutral service facade, wired together. Lives as long as the
  process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<analysis::AnalysisService> analysis;
  std::shared_ptr<service::GraphService> graph_service;
};

// Throws util::InvalidArgument on a malformed max_cache_size.
analysis::AnalysisConfig ToAnalysisConfig(const sbomgraph::runtime::config::AnalysisConfig& config);

/*
  Build

  Opens the configured database (bootstrapping its schema), registers the
  cache gauges and, when preload is set, builds every SBOM graph before
  returning.

  NOTE:
  This is the only place that knows the concrete repository types.
*/
Application Build(const sbomgraph::runtime::config::RuntimeConfig& config);

} // namespace sbomgraph::factory
