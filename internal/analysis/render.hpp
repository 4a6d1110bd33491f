#pragma once

#include <string>

#include "internal/graph/package_graph.hpp"

namespace sbomgraph::analysis {

// Graphviz DOT rendering of one SBOM graph. Nodes are labelled with
// name and version, edges with their relationship.
std::string RenderDot(const graph::PackageGraph& graph);

} // namespace sbomgraph::analysis
