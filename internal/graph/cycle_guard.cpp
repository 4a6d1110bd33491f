#include "internal/graph/cycle_guard.hpp"

#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace sbomgraph::graph {

namespace {

enum class Color : unsigned char { kWhite, kGray, kBlack };

void ReportBackEdge(const PackageGraph& graph, NodeIndex from, NodeIndex to) {
  const auto& start = model::Base(graph.NodeAt(from)).node_id;
  const auto& end   = model::Base(graph.NodeAt(to)).node_id;
  SBOMGRAPH_LOG_WARN("analysis graph of sbom " + graph.SbomId() + " has circular references (detected: " + start +
                         " -> " + end + ")!",
                     {observability::StringField("sbom_id", graph.SbomId())});
}

} // namespace

bool IsAcyclic(const PackageGraph& graph) {
  const auto          count = graph.NodeCount();
  std::vector<Color>  color(count, Color::kWhite);

  // (node, next outgoing position to look at)
  std::vector<std::pair<NodeIndex, std::size_t>> stack;

  for (NodeIndex root = 0; root < count; ++root) {
    if (color[root] != Color::kWhite) continue;

    color[root] = Color::kGray;
    stack.emplace_back(root, 0);

    while (!stack.empty()) {
      auto& [node, next] = stack.back();
      const auto& out    = graph.Outgoing(node);

      if (next == out.size()) {
        color[node] = Color::kBlack;
        stack.pop_back();
        continue;
      }

      const auto target = graph.EdgeAt(out[next++]).target;
      if (color[target] == Color::kGray) {
        ReportBackEdge(graph, node, target);
        return false;
      }
      if (color[target] == Color::kWhite) {
        color[target] = Color::kGray;
        stack.emplace_back(target, 0);
      }
    }
  }

  return true;
}

} // namespace sbomgraph::graph
