#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/purl.hpp"
#include "internal/model/relationship.hpp"

namespace sbomgraph::model {

/*
  Attributes shared by every node of a package graph.

  Identity inside one graph is (sbom_id, node_id). The same real-world
  component appearing in two SBOMs is two distinct nodes.
*/
struct BaseNode {
  std::string sbom_id;
  std::string node_id;
  std::string name;

  // owning document, copied onto every node for result rendering
  std::string document_id;
  std::string published;
};

struct PackageNode : BaseNode {
  std::string       version;
  std::vector<Purl> purl;
  std::vector<Cpe>  cpe;
};

// Stand-in for a component described by another SBOM document.
struct ExternalNode : BaseNode {
  std::string external_document_reference;
  std::string external_node_id;
};

// Document roots, files and anything else without package data.
struct UnknownNode : BaseNode {};

using Node = std::variant<PackageNode, ExternalNode, UnknownNode>;

inline const BaseNode& Base(const Node& node) {
  return std::visit([](const auto& n) -> const BaseNode& { return n; }, node);
}

inline bool IsExternal(const Node& node) {
  return std::holds_alternative<ExternalNode>(node);
}

// "This external reference actually points to this node of this SBOM."
struct ResolvedSbom {
  std::string sbom_id;
  std::string node_id;

  bool operator==(const ResolvedSbom&) const = default;
};

/*
  Projection of a graph node into a result record.
*/
struct BaseSummary {
  std::string              sbom_id;
  std::string              node_id;
  std::string              name;
  std::string              version;
  std::vector<std::string> purl;
  std::vector<std::string> cpe;
  std::string              document_id;
  std::string              published;
};

BaseSummary Summarize(const Node& node);

/*
  One entry of an analysis result.

  ancestors / descendants are nullopt when that direction was not
  expanded from this node (depth exhausted, already visited, branch
  ended at an unresolvable external reference), and an empty list when
  it was expanded but nothing matched.
*/
struct AnalysisNode {
  BaseSummary                              base;
  std::optional<Relationship>              relationship;
  std::optional<std::vector<AnalysisNode>> ancestors;
  std::optional<std::vector<AnalysisNode>> descendants;
};

struct AnalysisStatus {
  std::uint32_t sbom_count  = 0;
  std::uint32_t graph_count = 0;
};

} // namespace sbomgraph::model
