#include <cassert>
#include <iostream>
#include <variant>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/graph_builder.hpp"
#include "support/sbom_fixtures.hpp"

namespace {

using namespace sbomgraph;
using db::model::GraphNodeRow;
using db::model::GraphRows;
using db::model::NodeKind;

GraphNodeRow Row(const std::string& node_id, const std::string& name, NodeKind kind = NodeKind::kOther) {
  GraphNodeRow row;
  row.sbom_id = "s1";
  row.node_id = node_id;
  row.name    = name;
  row.kind    = kind;
  return row;
}

GraphRows BaseRows() {
  GraphRows rows;
  rows.sbom.sbom_id     = "s1";
  rows.sbom.document_id = "https://example.org/spdx/s1";
  rows.sbom.published   = "2024-03-01T12:00:00Z";
  return rows;
}

void TestNodesKeepFirstRowAndVariant() {
  auto rows = BaseRows();

  auto package    = Row("pkg", "openssl", NodeKind::kPackage);
  package.version = "3.0.7";
  package.purls   = {"pkg:generic/openssl@3.0.7", "not-a-purl"};
  package.cpes    = {"cpe:2.3:a:openssl:openssl:3.0.7:*:*:*:*:*:*:*", "cpe:bogus"};
  rows.nodes.push_back(package);
  rows.nodes.push_back(Row("pkg", "shadowed"));

  auto external              = Row("ext", "other document", NodeKind::kExternal);
  external.external_doc_ref  = "DocumentRef-other";
  external.external_node_ref = "SPDXRef-root";
  rows.nodes.push_back(external);
  rows.nodes.push_back(Row("doc", "document root"));

  auto graph = graph::BuildGraph(rows);
  assert(graph->NodeCount() == 3);

  const auto& first = graph->NodeAt(*graph->FindNode("pkg"));
  const auto* pkg   = std::get_if<model::PackageNode>(&first);
  assert(pkg != nullptr);
  assert(pkg->name == "openssl");
  assert(pkg->purl.size() == 1);
  assert(pkg->cpe.size() == 1);
  assert(pkg->document_id == "https://example.org/spdx/s1");
  assert(pkg->published == "2024-03-01T12:00:00Z");

  const auto* ext = std::get_if<model::ExternalNode>(&graph->NodeAt(*graph->FindNode("ext")));
  assert(ext != nullptr);
  assert(ext->external_document_reference == "DocumentRef-other");
  assert(ext->external_node_id == "SPDXRef-root");

  assert(std::holds_alternative<model::UnknownNode>(graph->NodeAt(*graph->FindNode("doc"))));
}

void TestMalformedRelationshipsAreSkipped() {
  auto rows = BaseRows();
  rows.nodes.push_back(Row("a", "a"));
  rows.nodes.push_back(Row("b", "b"));

  rows.relationships.push_back({"s1", "a", "depends_on", "b"});
  rows.relationships.push_back({"s1", "a", "depends_on", "missing"});
  rows.relationships.push_back({"s1", "a", "not_a_relationship", "b"});
  rows.relationships.push_back({"s1", "b", "contains", "a"});

  auto graph = graph::BuildGraph(rows);
  assert(graph->EdgeCount() == 2);

  const auto a = *graph->FindNode("a");
  const auto b = *graph->FindNode("b");
  assert(graph->Outgoing(a).size() == 1);
  assert(graph->Incoming(a).size() == 1);
  const auto& edge = graph->EdgeAt(graph->Outgoing(a).front());
  assert(edge.target == b);
  assert(edge.relationship == model::Relationship::kDependsOn);
}

void TestLoadGraphFromRepository() {
  db::memory::MemoryRepository repo;
  test::SeedCycloneDxPair(repo);

  auto tx    = repo.BeginRead();
  auto graph = graph::LoadGraph(repo, *tx, "sbom-a");
  assert(graph != nullptr);
  assert(graph->SbomId() == "sbom-a");
  assert(graph->NodeCount() == 3);
  assert(graph->EdgeCount() == 2);
  assert(model::IsExternal(graph->NodeAt(*graph->FindNode("ext-b"))));
  assert(graph->ApproximateSize() > 0);

  assert(graph::LoadGraph(repo, *tx, "missing") == nullptr);
}

} // namespace

int main() {
  TestNodesKeepFirstRowAndVariant();
  TestMalformedRelationshipsAreSkipped();
  TestLoadGraphFromRepository();

  std::cout << "sbomgraph_unit_graph_builder: pass\n";
  return 0;
}
