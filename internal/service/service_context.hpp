#pragma once

#include <memory>

namespace sbomgraph::analysis { class AnalysisService; }

namespace sbomgraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sbomgraph::analysis::AnalysisService> analysis;
};

}
