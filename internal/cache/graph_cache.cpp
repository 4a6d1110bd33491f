#include "internal/cache/graph_cache.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sbomgraph::cache {

GraphCache::GraphCache(std::size_t max_size) : max_size_(max_size) {
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

GraphCache::GraphPtr GraphCache::Get(const std::string& sbom_id) const {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(sbom_id);
  if (it == entries_.end()) return nullptr;

  TouchLocked(it->second);
  return it->second.graph;
}

GraphCache::GraphPtr GraphCache::GetOrBuild(const std::string& sbom_id, const Loader& loader) {
  if (auto graph = Get(sbom_id)) {
    observability::Metrics::Instance().RecordCacheLookup(true);
    return graph;
  }
  observability::Metrics::Instance().RecordCacheLookup(false);

  auto graph = loader();
  if (!graph) return nullptr;

  return Insert(sbom_id, std::move(graph));
}

// ------------------------------------------------------------
// Insert / evict
// ------------------------------------------------------------

GraphCache::GraphPtr GraphCache::Insert(const std::string& sbom_id, GraphPtr graph) {
  const auto weight = graph->ApproximateSize();
  if (weight > max_size_) {
    SBOMGRAPH_LOG_WARN("graph exceeds cache capacity, not cached",
                       {observability::StringField("sbom_id", sbom_id),
                        observability::BytesField("weight", weight),
                        observability::BytesField("max_size", max_size_)});
    return graph;
  }

  std::lock_guard lock(mutex_);

  auto [it, inserted] = entries_.try_emplace(sbom_id);
  if (!inserted) {
    // lost a concurrent build; share the resident copy
    TouchLocked(it->second);
    return it->second.graph;
  }

  recency_.push_front(sbom_id);
  it->second.graph    = graph;
  it->second.weight   = weight;
  it->second.position = recency_.begin();

  size_used_ += weight;
  EvictLocked();
  return graph;
}

void GraphCache::TouchLocked(const Entry& entry) const {
  recency_.splice(recency_.begin(), recency_, entry.position);
}

void GraphCache::EvictLocked() {
  while (size_used_ > max_size_ && !recency_.empty()) {
    auto victim = entries_.find(recency_.back());
    recency_.pop_back();

    size_used_ -= victim->second.weight;
    entries_.erase(victim);
    observability::Metrics::Instance().RecordCacheEviction();
  }
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::size_t GraphCache::SizeUsed() const {
  std::lock_guard lock(mutex_);
  return size_used_;
}

std::size_t GraphCache::Len() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void GraphCache::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
  recency_.clear();
  size_used_ = 0;
}

} // namespace sbomgraph::cache
