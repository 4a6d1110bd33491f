#pragma once

#include "internal/graph/package_graph.hpp"

namespace sbomgraph::graph {

/*
  Back-edge detection run before a graph is traversed.

  Depth-first search from every unvisited node; stops at the first edge
  that closes a cycle (self-loops included), logs a warning naming both
  endpoints and returns false. Callers exclude such graphs instead of
  traversing them.
*/
bool IsAcyclic(const PackageGraph& graph);

} // namespace sbomgraph::graph
