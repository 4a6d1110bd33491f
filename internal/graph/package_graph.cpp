#include "internal/graph/package_graph.hpp"

#include "internal/util/overloaded.hpp"

namespace sbomgraph::graph {

namespace {

std::size_t StringBytes(const std::string& s) {
  return s.capacity();
}

std::size_t BaseBytes(const model::BaseNode& n) {
  return StringBytes(n.sbom_id) + StringBytes(n.node_id) + StringBytes(n.name) + StringBytes(n.document_id) +
         StringBytes(n.published);
}

std::size_t NodeBytes(const model::Node& node) {
  return sizeof(model::Node) + std::visit(util::Overloaded{
                                              [](const model::PackageNode& n) {
                                                std::size_t bytes = BaseBytes(n) + StringBytes(n.version);
                                                bytes += n.purl.capacity() * sizeof(model::Purl);
                                                for (const auto& p : n.purl) bytes += 2 * p.ToString().size();
                                                bytes += n.cpe.capacity() * sizeof(model::Cpe);
                                                for (const auto& c : n.cpe) bytes += StringBytes(c.ToString());
                                                return bytes;
                                              },
                                              [](const model::ExternalNode& n) {
                                                return BaseBytes(n) + StringBytes(n.external_document_reference) +
                                                       StringBytes(n.external_node_id);
                                              },
                                              [](const model::UnknownNode& n) { return BaseBytes(n); },
                                          },
                                          node);
}

} // namespace

PackageGraph::PackageGraph(std::string sbom_id) : sbom_id_(std::move(sbom_id)) {
}

NodeIndex PackageGraph::AddNode(model::Node node) {
  const auto& node_id = model::Base(node).node_id;
  if (auto it = index_.find(node_id); it != index_.end()) {
    return it->second;
  }

  const auto index = static_cast<NodeIndex>(nodes_.size());
  index_.emplace(node_id, index);
  nodes_.push_back(std::move(node));
  outgoing_.emplace_back();
  incoming_.emplace_back();
  return index;
}

void PackageGraph::AddEdge(NodeIndex source, NodeIndex target, model::Relationship relationship) {
  const auto position = edges_.size();
  edges_.push_back(Edge{source, target, relationship});
  outgoing_[source].push_back(position);
  incoming_[target].push_back(position);
}

std::optional<NodeIndex> PackageGraph::FindNode(std::string_view node_id) const {
  auto it = index_.find(std::string(node_id));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::size_t PackageGraph::ApproximateSize() const {
  std::size_t bytes = sizeof(PackageGraph) + StringBytes(sbom_id_);

  for (const auto& node : nodes_) bytes += NodeBytes(node);
  bytes += (nodes_.capacity() - nodes_.size()) * sizeof(model::Node);

  bytes += edges_.capacity() * sizeof(Edge);

  for (std::size_t i = 0; i < outgoing_.size(); ++i) {
    bytes += 2 * sizeof(std::vector<std::size_t>);
    bytes += (outgoing_[i].capacity() + incoming_[i].capacity()) * sizeof(std::size_t);
  }

  // key copy plus bucket / node overhead
  for (const auto& [key, _] : index_) bytes += StringBytes(key) + sizeof(NodeIndex) + 2 * sizeof(void*);
  bytes += index_.bucket_count() * sizeof(void*);

  return bytes;
}

} // namespace sbomgraph::graph
