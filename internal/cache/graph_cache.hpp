#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/graph/package_graph.hpp"

namespace sbomgraph::cache {

/*
  Bounded map SBOM id -> shared immutable graph.

  - Every hit moves the entry to the front of the recency list.
  - Builds run outside any lock; two callers may build the same graph
    concurrently, the first insert wins and both get the resident copy.
  - After every insert size_used() <= max_size(), evicting least
    from the back of the recency list. Eviction only drops the cache's
    reference; graphs held by running traversals stay alive.
  - A graph heavier than max_size() is returned but not kept.
  - Loader failures propagate and leave no entry behind.
*/
class GraphCache {
 public:
  using GraphPtr = std::shared_ptr<const graph::PackageGraph>;

  // Returns nullptr when the SBOM does not exist; nothing is cached then.
  using Loader = std::function<GraphPtr()>;

  explicit GraphCache(std::size_t max_size);

  GraphCache(const GraphCache&)            = delete;
  GraphCache& operator=(const GraphCache&) = delete;

  GraphPtr Get(const std::string& sbom_id) const;

  GraphPtr GetOrBuild(const std::string& sbom_id, const Loader& loader);

  // total weight of resident graphs, in bytes
  std::size_t SizeUsed() const;

  // number of resident graphs
  std::size_t Len() const;

  std::size_t MaxSize() const {
    return max_size_;
  }

  void Clear();

 private:
  // most recently used first
  using RecencyList = std::list<std::string>;

  struct Entry {
    GraphPtr              graph;
    std::size_t           weight = 0;
    RecencyList::iterator position;
  };

  GraphPtr Insert(const std::string& sbom_id, GraphPtr graph);

  // caller holds mutex_
  void TouchLocked(const Entry& entry) const;
  void EvictLocked();

  const std::size_t max_size_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_;
  mutable RecencyList                    recency_;
  std::size_t                            size_used_ = 0;
};

} // namespace sbomgraph::cache
