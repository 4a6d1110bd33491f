#pragma once

#include <string>
#include <vector>

#include "internal/db/model/relationship_record.hpp"
#include "internal/db/model/sbom_record.hpp"

namespace sbomgraph::db::model {

enum class NodeKind {
  kPackage,
  kExternal,
  kOther,
};

/*
  Joined view of one node as needed by the graph builder.
  purls / cpes are only populated for packages, the external_* fields
  only for external nodes.
*/
struct GraphNodeRow {
  std::string              sbom_id;
  std::string              node_id;
  std::string              name;
  NodeKind                 kind = NodeKind::kOther;
  std::string              version;
  std::vector<std::string> purls;
  std::vector<std::string> cpes;
  std::string              external_doc_ref;
  std::string              external_node_ref;
};

// Everything needed to build the package graph of one SBOM.
struct GraphRows {
  SbomRecord                      sbom;
  std::vector<GraphNodeRow>       nodes;
  std::vector<RelationshipRecord> relationships;
};

} // namespace sbomgraph::db::model
