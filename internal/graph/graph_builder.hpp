#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/graph_rows.hpp"
#include "internal/graph/package_graph.hpp"

namespace sbomgraph::graph {

/*
  Turns the rows of one SBOM into a PackageGraph.

  Nodes first, one per distinct node id (first row wins). Then one edge
  per relationship row. Rows referencing an unknown node, or carrying a
  relationship name outside the closed set, are skipped; the count is
  logged at debug level. Unparsable purl / cpe strings are dropped the
  same way.
*/
std::shared_ptr<const PackageGraph> BuildGraph(const db::model::GraphRows& rows);

// nullptr when the SBOM does not exist. Data access failures propagate.
std::shared_ptr<const PackageGraph> LoadGraph(db::Repository& repo, db::Transaction& tx, const std::string& sbom_id);

} // namespace sbomgraph::graph
