#include "internal/analysis/analysis_service.hpp"

#include <future>
#include <utility>

#include "internal/analysis/collector.hpp"
#include "internal/analysis/render.hpp"
#include "internal/graph/cycle_guard.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace sbomgraph::analysis {

namespace {

// Waits for every future before reading any, so no task outlives the
// request when one of them failed. The first failure is rethrown.
template <typename T>
std::vector<T> Gather(std::vector<std::future<T>>& futures) {
  for (auto& f : futures) f.wait();

  std::vector<T> results;
  results.reserve(futures.size());
  for (auto& f : futures) results.push_back(f.get());
  return results;
}

cache::GraphCache::GraphPtr LoadThroughCache(db::Repository& repo, cache::GraphCache& cache, const std::string& sbom_id) {
  auto tx = repo.BeginRead();
  return cache.GetOrBuild(sbom_id, [&] { return graph::LoadGraph(repo, *tx, sbom_id); });
}

} // namespace

AnalysisService::AnalysisService(std::shared_ptr<db::Repository> repo, const AnalysisConfig& config)
    : repo_(std::move(repo)),
      cache_(std::make_shared<cache::GraphCache>(config.max_cache_size)),
      pool_(std::make_shared<ExpansionPool>(config.concurrency)) {
}

// ------------------------------------------------------------
// Retrieval
// ------------------------------------------------------------

AnalysisService::Results AnalysisService::Retrieve(const query::GraphQuery& query, const QueryOptions& options,
                                                   const model::Paginated& page) const {
  observability::SpanScope span("AnalysisService/Retrieve");
  span.SetAttribute("query", query::Describe(query));

  const auto sbom_ids = ScopeSboms(query);
  const auto graphs   = LoadGraphs(sbom_ids);
  auto       nodes    = RunGraphQuery(query, options, graphs);

  span.SetAttribute("sboms", static_cast<std::int64_t>(sbom_ids.size()));
  span.SetAttribute("matches", static_cast<std::int64_t>(nodes.size()));

  return model::Paginate(std::move(nodes), page);
}

AnalysisService::Results AnalysisService::RetrieveSingle(const std::string& sbom_id, const query::GraphQuery& query,
                                                         const QueryOptions& options, const model::Paginated& page) const {
  observability::SpanScope span("AnalysisService/RetrieveSingle");
  span.SetAttribute("sbom_id", sbom_id);
  span.SetAttribute("query", query::Describe(query));

  const auto graphs = LoadGraphs({sbom_id});
  auto       nodes  = RunGraphQuery(query, options, graphs);

  return model::Paginate(std::move(nodes), page);
}

std::vector<std::string> AnalysisService::ScopeSboms(const query::GraphQuery& query) const {
  auto  tx   = repo_->BeginRead();
  auto& repo = *repo_;

  return std::visit(
      util::Overloaded{
          [&](const query::ComponentReference& ref) {
            return std::visit(util::Overloaded{
                                  [&](const query::ComponentId& id) { return repo.FindSbomsByNodeId(*tx, id.node_id); },
                                  [&](const query::ComponentName& name) { return repo.FindSbomsByName(*tx, name.name); },
                                  [&](const model::Purl& purl) { return repo.FindSbomsByPurl(*tx, purl.ToString()); },
                                  [&](const model::Cpe& cpe) { return repo.FindSbomsByCpe(*tx, cpe.ToString()); },
                              },
                              ref);
          },
          [&](const query::FilterExpression&) { return repo.ListSbomIds(*tx); },
      },
      query);
}

AnalysisService::Graphs AnalysisService::LoadGraphs(const std::vector<std::string>& sbom_ids) const {
  std::vector<std::future<cache::GraphCache::GraphPtr>> futures;
  futures.reserve(sbom_ids.size());

  for (const auto& sbom_id : sbom_ids) {
    futures.push_back(pool_->Submit([repo = repo_, cache = cache_, sbom_id] { return LoadThroughCache(*repo, *cache, sbom_id); }));
  }

  Graphs graphs;
  for (auto& graph : Gather(futures)) {
    if (graph) graphs.push_back(std::move(graph));
  }
  return graphs;
}

std::vector<model::AnalysisNode> AnalysisService::RunGraphQuery(const query::GraphQuery& query, const QueryOptions& options,
                                                                const Graphs& graphs) const {
  std::vector<std::future<model::AnalysisNode>> futures;

  for (const auto& graph : graphs) {
    if (!graph::IsAcyclic(*graph)) continue;

    for (graph::NodeIndex i = 0; i < graph->NodeCount(); ++i) {
      const auto& node = graph->NodeAt(i);
      if (!query::Matches(query, node)) continue;

      SBOMGRAPH_LOG_DEBUG("discovered node", {observability::StringField("sbom_id", model::Base(node).sbom_id),
                                              observability::StringField("node_id", model::Base(node).node_id)});

      futures.push_back(pool_->Submit([repo = repo_, cache = cache_, graph, i, options] {
        auto tx = repo->BeginRead();

        model::AnalysisNode record;
        record.base = model::Summarize(graph->NodeAt(i));

        Collector ancestors(*cache, *repo, *tx, options.relationships, Direction::kAncestors);
        record.ancestors = ancestors.Collect(*graph, i, options.ancestors);

        Collector descendants(*cache, *repo, *tx, options.relationships, Direction::kDescendants);
        record.descendants = descendants.Collect(*graph, i, options.descendants);

        return record;
      }));
    }
  }

  return Gather(futures);
}

// ------------------------------------------------------------
// Cache / status
// ------------------------------------------------------------

model::AnalysisStatus AnalysisService::Status() const {
  auto tx = repo_->BeginRead();

  model::AnalysisStatus status;
  status.sbom_count  = static_cast<std::uint32_t>(repo_->ListSbomIds(*tx).size());
  status.graph_count = static_cast<std::uint32_t>(cache_->Len());
  return status;
}

void AnalysisService::ClearAllGraphs() const {
  cache_->Clear();
  SBOMGRAPH_LOG_INFO("graph cache cleared");
}

std::uint64_t AnalysisService::CacheSizeUsed() const {
  return cache_->SizeUsed();
}

std::uint64_t AnalysisService::CacheLen() const {
  return cache_->Len();
}

std::size_t AnalysisService::LoadAllGraphs() const {
  std::vector<std::string> sbom_ids;
  {
    auto tx  = repo_->BeginRead();
    sbom_ids = repo_->ListSbomIds(*tx);
  }

  const auto graphs = LoadGraphs(sbom_ids);
  SBOMGRAPH_LOG_INFO("graphs loaded", {observability::IntField("sboms", static_cast<std::int64_t>(sbom_ids.size())),
                                       observability::IntField("graphs", static_cast<std::int64_t>(graphs.size())),
                                       observability::BytesField("cache_size", cache_->SizeUsed())});
  return graphs.size();
}

std::string AnalysisService::RenderGraph(const std::string& sbom_id) const {
  auto graph = LoadThroughCache(*repo_, *cache_, sbom_id);
  if (!graph) throw util::NotFound("sbom not found: " + sbom_id);
  return RenderDot(*graph);
}

} // namespace sbomgraph::analysis
