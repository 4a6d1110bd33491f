#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/analysis/expansion_pool.hpp"
#include "internal/analysis/query_options.hpp"
#include "internal/cache/graph_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/node.hpp"
#include "internal/model/pagination.hpp"
#include "internal/query/graph_query.hpp"

namespace sbomgraph::analysis {

struct AnalysisConfig {
  std::size_t max_cache_size = 200 * 1024 * 1024;

  // expansion workers; 0 selects the hardware concurrency
  std::size_t concurrency = 0;
};

/*
  Dependency-graph analysis over the SBOMs of a repository.

  Each request runs Load -> Admit -> Match -> Expand -> Paginate:

    Load     graphs of the SBOMs in scope, through the cache
    Admit    drop graphs with circular references (warning logged)
    Match    nodes selected by the query
    Expand   ancestors / descendants of every match, one pool task each
    Paginate offset / limit over the matches

  The graph cache and the worker pool are created with the instance;
  copies share them, a new instance starts with an empty cache.

  Data access failures propagate as util::DataAccessError. Result
  order across SBOMs is unspecified.
*/
class AnalysisService {
 public:
  using Results = model::PaginatedResults<model::AnalysisNode>;

  AnalysisService(std::shared_ptr<db::Repository> repo, const AnalysisConfig& config);

  // Components matching `query` in every SBOM that may contain them.
  Results Retrieve(const query::GraphQuery& query, const QueryOptions& options, const model::Paginated& page) const;

  // Same within one SBOM. Unknown SBOMs yield an empty page.
  Results RetrieveSingle(const std::string& sbom_id, const query::GraphQuery& query, const QueryOptions& options,
                         const model::Paginated& page) const;

  model::AnalysisStatus Status() const;

  void ClearAllGraphs() const;

  std::uint64_t CacheSizeUsed() const;

  std::uint64_t CacheLen() const;

  // Warms the cache with every SBOM; returns the number of graphs loaded.
  std::size_t LoadAllGraphs() const;

  // DOT rendering of one SBOM graph. Throws util::NotFound for unknown SBOMs.
  std::string RenderGraph(const std::string& sbom_id) const;

  const std::shared_ptr<cache::GraphCache>& Cache() const {
    return cache_;
  }

 private:
  using Graphs = std::vector<cache::GraphCache::GraphPtr>;

  std::vector<std::string> ScopeSboms(const query::GraphQuery& query) const;

  Graphs LoadGraphs(const std::vector<std::string>& sbom_ids) const;

  std::vector<model::AnalysisNode> RunGraphQuery(const query::GraphQuery& query, const QueryOptions& options,
                                                 const Graphs& graphs) const;

  std::shared_ptr<db::Repository>    repo_;
  std::shared_ptr<cache::GraphCache> cache_;
  std::shared_ptr<ExpansionPool>     pool_;
};

} // namespace sbomgraph::analysis
