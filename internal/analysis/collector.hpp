#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/cache/graph_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/package_graph.hpp"
#include "internal/model/node.hpp"

namespace sbomgraph::analysis {

enum class Direction {
  kAncestors,   // incoming edges
  kDescendants, // outgoing edges
};

/*
  Depth-bounded expansion of one direction from one starting node.

  Every (sbom_id, node_id) is expanded at most once per Collector; a
  node reached again is still listed, as a leaf. External reference
  nodes are resolved through the data-access layer and continue in the
  target SBOM's graph, fetched through the cache; the resolved node is
  their single child and costs one depth level.

  Not thread-safe; use one Collector per expansion.
*/
class Collector {
 public:
  Collector(cache::GraphCache& cache, db::Repository& repo, db::Transaction& tx, const model::RelationshipSet& relationships,
            Direction direction);

  // nullopt when depth is 0 or the node was already expanded
  std::optional<std::vector<model::AnalysisNode>> Collect(const graph::PackageGraph& graph, graph::NodeIndex node, std::uint64_t depth);

 private:
  std::optional<std::vector<model::AnalysisNode>> CollectExternal(const graph::PackageGraph& graph, graph::NodeIndex node,
                                                                  std::uint64_t depth);

  bool Allowed(model::Relationship relationship) const;

  // cycle check of graphs reached through external references, memoized
  bool Admit(const graph::PackageGraph& graph);

  model::AnalysisNode Record(const model::Node& node, std::optional<model::Relationship> relationship,
                             std::optional<std::vector<model::AnalysisNode>> children) const;

  cache::GraphCache&            cache_;
  db::Repository&               repo_;
  db::Transaction&              tx_;
  const model::RelationshipSet& relationships_;
  Direction                     direction_;

  std::unordered_set<std::string>       visited_;
  std::unordered_map<std::string, bool> admitted_;
};

} // namespace sbomgraph::analysis
