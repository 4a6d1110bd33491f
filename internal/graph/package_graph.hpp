#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/node.hpp"
#include "internal/model/relationship.hpp"

namespace sbomgraph::graph {

using NodeIndex = std::uint32_t;

struct Edge {
  NodeIndex           source;
  NodeIndex           target;
  model::Relationship relationship;
};

/*
  Directed multigraph of one SBOM.

  Nodes live in an arena addressed by NodeIndex; edges are stored once and
  referenced from per-node incoming / outgoing lists by position. Indices
  are stable for the lifetime of the graph.

  Built by graph::BuildGraph, then shared as shared_ptr<const PackageGraph>
  and never mutated again. May contain cycles.
*/
class PackageGraph {
 public:
  explicit PackageGraph(std::string sbom_id);

  // ---------------------------------------------------------------------
  // Construction (builder only)
  // ---------------------------------------------------------------------

  // Returns the existing index when node_id is already present.
  NodeIndex AddNode(model::Node node);

  void AddEdge(NodeIndex source, NodeIndex target, model::Relationship relationship);

  // ---------------------------------------------------------------------
  // Access
  // ---------------------------------------------------------------------

  const std::string& SbomId() const {
    return sbom_id_;
  }

  std::size_t NodeCount() const {
    return nodes_.size();
  }

  std::size_t EdgeCount() const {
    return edges_.size();
  }

  const model::Node& NodeAt(NodeIndex index) const {
    return nodes_[index];
  }

  const Edge& EdgeAt(std::size_t index) const {
    return edges_[index];
  }

  // positions into the edge list
  const std::vector<std::size_t>& Outgoing(NodeIndex index) const {
    return outgoing_[index];
  }

  const std::vector<std::size_t>& Incoming(NodeIndex index) const {
    return incoming_[index];
  }

  std::optional<NodeIndex> FindNode(std::string_view node_id) const;

  // Approximate heap footprint in bytes, used as the cache weight.
  std::size_t ApproximateSize() const;

 private:
  std::string                                sbom_id_;
  std::vector<model::Node>                   nodes_;
  std::vector<Edge>                          edges_;
  std::vector<std::vector<std::size_t>>      outgoing_;
  std::vector<std::vector<std::size_t>>      incoming_;
  std::unordered_map<std::string, NodeIndex> index_;
};

} // namespace sbomgraph::graph
