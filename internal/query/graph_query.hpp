#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "internal/model/node.hpp"
#include "internal/model/purl.hpp"
#include "internal/query/filter_expression.hpp"

namespace sbomgraph::query {

struct ComponentId {
  std::string node_id;
};

struct ComponentName {
  std::string name;
};

/*
  Exact reference to a component.

  Id / Name compare against every node; Purl / Cpe only against package
  nodes, by set membership.
*/
using ComponentReference = std::variant<ComponentId, ComponentName, model::Purl, model::Cpe>;

// "pkg:..." -> Purl, "cpe:..." -> Cpe, anything else -> Name.
// Throws util::InvalidArgument when a purl or cpe does not parse.
ComponentReference ParseComponentReference(std::string_view text);

// Locates the starting nodes of an analysis.
using GraphQuery = std::variant<ComponentReference, FilterExpression>;

bool Matches(const GraphQuery& query, const model::Node& node);

// Human-readable form for logs and spans.
std::string Describe(const GraphQuery& query);

} // namespace sbomgraph::query
