#include "internal/query/graph_query.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace sbomgraph::query {

ComponentReference ParseComponentReference(std::string_view text) {
  if (text.starts_with("pkg:")) {
    auto purl = model::Purl::Parse(text);
    if (!purl) throw util::InvalidArgument("invalid purl: " + std::string(text));
    return *purl;
  }

  if (text.starts_with("cpe:")) {
    auto cpe = model::Cpe::Parse(text);
    if (!cpe) throw util::InvalidArgument("invalid cpe: " + std::string(text));
    return *cpe;
  }

  return ComponentName{std::string(text)};
}

namespace {

bool MatchesComponent(const ComponentReference& ref, const model::Node& node) {
  return std::visit(
      util::Overloaded{
          [&](const ComponentId& id) { return model::Base(node).node_id == id.node_id; },
          [&](const ComponentName& name) { return model::Base(node).name == name.name; },
          [&](const model::Purl& purl) {
            const auto* package = std::get_if<model::PackageNode>(&node);
            return package && std::find(package->purl.begin(), package->purl.end(), purl) != package->purl.end();
          },
          [&](const model::Cpe& cpe) {
            const auto* package = std::get_if<model::PackageNode>(&node);
            return package && std::find(package->cpe.begin(), package->cpe.end(), cpe) != package->cpe.end();
          },
      },
      ref);
}

} // namespace

bool Matches(const GraphQuery& query, const model::Node& node) {
  return std::visit(util::Overloaded{
                        [&](const ComponentReference& ref) { return MatchesComponent(ref, node); },
                        [&](const FilterExpression& expr) { return expr.Matches(node); },
                    },
                    query);
}

std::string Describe(const GraphQuery& query) {
  return std::visit(util::Overloaded{
                        [](const ComponentReference& ref) {
                          return std::visit(util::Overloaded{
                                                [](const ComponentId& id) { return "id:" + id.node_id; },
                                                [](const ComponentName& name) { return "name:" + name.name; },
                                                [](const model::Purl& purl) { return "purl:" + purl.ToString(); },
                                                [](const model::Cpe& cpe) { return "cpe:" + cpe.ToString(); },
                                            },
                                            ref);
                        },
                        [](const FilterExpression& expr) { return "q:" + expr.Text(); },
                    },
                    query);
}

} // namespace sbomgraph::query
