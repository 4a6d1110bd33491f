#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sbomgraph::model {

/*
  Edge label of a package graph.

  A row "left REL right" becomes the edge left -> right, so for
  "P1 depends_on P2" the descendants of P1 contain P2 and the
  ancestors of P2 contain P1.

  Stored as snake_case text in the relational schema.
*/
enum class Relationship : std::uint8_t {
  kContains,
  kDependsOn,
  kDevDependsOn,
  kOptionalDependsOn,
  kProvidedDependsOn,
  kTestDependsOn,
  kRuntimeDependsOn,
  kExampleOf,
  kGeneratedFrom,
  kAncestorOf,
  kVariantOf,
  kBuildToolOf,
  kDevToolOf,
  kDescribes,
  kPackageOf,
  kUndefined,
};

using RelationshipSet = std::set<Relationship>;

std::string_view ToString(Relationship relationship);

// nullopt for names outside the closed set
std::optional<Relationship> ParseRelationship(std::string_view name);

// Throws util::InvalidArgument on the first unknown name.
RelationshipSet ParseRelationships(const std::vector<std::string>& names);

} // namespace sbomgraph::model
