#include "internal/graph/graph_builder.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sbomgraph::graph {

namespace {

template <typename T>
void FillBase(T& node, const db::model::GraphNodeRow& row, const db::model::SbomRecord& sbom) {
  node.sbom_id     = row.sbom_id;
  node.node_id     = row.node_id;
  node.name        = row.name;
  node.document_id = sbom.document_id;
  node.published   = sbom.published;
}

model::Node ToNode(const db::model::GraphNodeRow& row, const db::model::SbomRecord& sbom, std::size_t& dropped_refs) {
  switch (row.kind) {
    case db::model::NodeKind::kPackage: {
      model::PackageNode node;
      FillBase(node, row, sbom);
      node.version = row.version;
      for (const auto& text : row.purls) {
        if (auto purl = model::Purl::Parse(text)) {
          node.purl.push_back(std::move(*purl));
        } else {
          ++dropped_refs;
        }
      }
      for (const auto& text : row.cpes) {
        if (auto cpe = model::Cpe::Parse(text)) {
          node.cpe.push_back(std::move(*cpe));
        } else {
          ++dropped_refs;
        }
      }
      return node;
    }
    case db::model::NodeKind::kExternal: {
      model::ExternalNode node;
      FillBase(node, row, sbom);
      node.external_document_reference = row.external_doc_ref;
      node.external_node_id            = row.external_node_ref;
      return node;
    }
    case db::model::NodeKind::kOther:
      break;
  }

  model::UnknownNode node;
  FillBase(node, row, sbom);
  return node;
}

} // namespace

std::shared_ptr<const PackageGraph> BuildGraph(const db::model::GraphRows& rows) {
  auto graph = std::make_shared<PackageGraph>(rows.sbom.sbom_id);

  std::size_t dropped_refs = 0;
  for (const auto& row : rows.nodes) {
    if (graph->FindNode(row.node_id)) continue;
    graph->AddNode(ToNode(row, rows.sbom, dropped_refs));
  }

  std::size_t skipped_edges = 0;
  for (const auto& rel : rows.relationships) {
    auto relationship = model::ParseRelationship(rel.relationship);
    auto source       = graph->FindNode(rel.left_node_id);
    auto target       = graph->FindNode(rel.right_node_id);
    if (!relationship || !source || !target) {
      ++skipped_edges;
      continue;
    }
    graph->AddEdge(*source, *target, *relationship);
  }

  if (skipped_edges > 0 || dropped_refs > 0) {
    SBOMGRAPH_LOG_DEBUG("graph built with skipped rows",
                        {observability::StringField("sbom_id", rows.sbom.sbom_id),
                         observability::IntField("skipped_edges", static_cast<std::int64_t>(skipped_edges)),
                         observability::IntField("dropped_refs", static_cast<std::int64_t>(dropped_refs))});
  }

  return graph;
}

std::shared_ptr<const PackageGraph> LoadGraph(db::Repository& repo, db::Transaction& tx, const std::string& sbom_id) {
  const auto started = std::chrono::steady_clock::now();

  auto rows = repo.FetchGraphRows(tx, sbom_id);
  if (!rows) return nullptr;

  auto graph = BuildGraph(*rows);

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveGraphBuildMs(elapsed);
  SBOMGRAPH_LOG_DEBUG("graph loaded", {observability::StringField("sbom_id", sbom_id),
                                       observability::IntField("nodes", static_cast<std::int64_t>(graph->NodeCount())),
                                       observability::IntField("edges", static_cast<std::int64_t>(graph->EdgeCount()))});
  return graph;
}

} // namespace sbomgraph::graph
