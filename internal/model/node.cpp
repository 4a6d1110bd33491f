#include "internal/model/node.hpp"

#include "internal/util/overloaded.hpp"

namespace sbomgraph::model {

namespace {

BaseSummary FromBase(const BaseNode& node) {
  BaseSummary summary;
  summary.sbom_id     = node.sbom_id;
  summary.node_id     = node.node_id;
  summary.name        = node.name;
  summary.document_id = node.document_id;
  summary.published   = node.published;
  return summary;
}

} // namespace

BaseSummary Summarize(const Node& node) {
  return std::visit(util::Overloaded{
                        [](const PackageNode& package) {
                          auto summary    = FromBase(package);
                          summary.version = package.version;
                          for (const auto& purl : package.purl) summary.purl.push_back(purl.ToString());
                          for (const auto& cpe : package.cpe) summary.cpe.push_back(cpe.ToString());
                          return summary;
                        },
                        [](const ExternalNode& external) { return FromBase(external); },
                        [](const UnknownNode& unknown) { return FromBase(unknown); },
                    },
                    node);
}

} // namespace sbomgraph::model
