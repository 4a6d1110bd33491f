#pragma once

#include <string>

namespace sbomgraph::db::model {

/*
  package_relates_to_package

    left ---relationship---> right

  relationship is the snake_case text of model::Relationship. Endpoints
  are not enforced by the schema; ingestion may leave dangling ones.
*/
struct RelationshipRecord {
  std::string sbom_id;
  std::string left_node_id;
  std::string relationship;
  std::string right_node_id;
};

} // namespace sbomgraph::db::model
