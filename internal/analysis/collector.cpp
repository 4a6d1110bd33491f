#include "internal/analysis/collector.hpp"

#include "internal/graph/cycle_guard.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolve/external_resolver.hpp"

namespace sbomgraph::analysis {

namespace {

std::string VisitKey(const model::BaseNode& node) {
  return node.sbom_id + '\0' + node.node_id;
}

} // namespace

Collector::Collector(cache::GraphCache& cache, db::Repository& repo, db::Transaction& tx,
                     const model::RelationshipSet& relationships, Direction direction)
    : cache_(cache), repo_(repo), tx_(tx), relationships_(relationships), direction_(direction) {
}

std::optional<std::vector<model::AnalysisNode>> Collector::Collect(const graph::PackageGraph& graph, graph::NodeIndex node,
                                                                   std::uint64_t depth) {
  if (depth == 0) return std::nullopt;

  const auto& current = graph.NodeAt(node);
  if (!visited_.insert(VisitKey(model::Base(current))).second) return std::nullopt;

  if (model::IsExternal(current)) return CollectExternal(graph, node, depth);

  std::vector<model::AnalysisNode> result;

  const auto& edges = direction_ == Direction::kAncestors ? graph.Incoming(node) : graph.Outgoing(node);
  for (const auto position : edges) {
    const auto& edge = graph.EdgeAt(position);
    if (!Allowed(edge.relationship)) continue;

    const auto neighbor = direction_ == Direction::kAncestors ? edge.source : edge.target;
    auto       children = Collect(graph, neighbor, depth - 1);
    result.push_back(Record(graph.NodeAt(neighbor), edge.relationship, std::move(children)));
  }

  return result;
}

std::optional<std::vector<model::AnalysisNode>> Collector::CollectExternal(const graph::PackageGraph& graph, graph::NodeIndex node,
                                                                           std::uint64_t depth) {
  const auto& external = model::Base(graph.NodeAt(node));

  auto resolved = resolve::ResolveExternalSbom(repo_, tx_, external.node_id);
  if (!resolved) return std::nullopt;

  auto target_graph = cache_.GetOrBuild(resolved->sbom_id, [&] { return graph::LoadGraph(repo_, tx_, resolved->sbom_id); });
  if (!target_graph) {
    SBOMGRAPH_LOG_DEBUG("external reference points to an unknown sbom",
                        {observability::StringField("node_id", external.node_id),
                         observability::StringField("target_sbom_id", resolved->sbom_id)});
    return std::nullopt;
  }

  if (!Admit(*target_graph)) return std::nullopt;

  auto target = target_graph->FindNode(resolved->node_id);
  if (!target) {
    SBOMGRAPH_LOG_DEBUG("external reference points to an unknown node",
                        {observability::StringField("node_id", external.node_id),
                         observability::StringField("target_sbom_id", resolved->sbom_id),
                         observability::StringField("target_node_id", resolved->node_id)});
    return std::nullopt;
  }

  // target_graph stays alive until the subtree is built, even if evicted meanwhile
  auto children = Collect(*target_graph, *target, depth - 1);

  std::vector<model::AnalysisNode> result;
  result.push_back(Record(target_graph->NodeAt(*target), std::nullopt, std::move(children)));
  return result;
}

bool Collector::Allowed(model::Relationship relationship) const {
  return relationships_.empty() || relationships_.contains(relationship);
}

bool Collector::Admit(const graph::PackageGraph& graph) {
  auto it = admitted_.find(graph.SbomId());
  if (it != admitted_.end()) return it->second;

  const bool acyclic = graph::IsAcyclic(graph);
  admitted_.emplace(graph.SbomId(), acyclic);
  return acyclic;
}

model::AnalysisNode Collector::Record(const model::Node& node, std::optional<model::Relationship> relationship,
                                      std::optional<std::vector<model::AnalysisNode>> children) const {
  model::AnalysisNode record;
  record.base         = model::Summarize(node);
  record.relationship = relationship;
  if (direction_ == Direction::kAncestors) {
    record.ancestors = std::move(children);
  } else {
    record.descendants = std::move(children);
  }
  return record;
}

} // namespace sbomgraph::analysis
