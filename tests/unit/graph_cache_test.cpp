#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/graph_cache.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sbomgraph;
using cache::GraphCache;

GraphCache::GraphPtr MakeGraph(const std::string& sbom_id) {
  auto graph = std::make_shared<graph::PackageGraph>(sbom_id);
  model::PackageNode node;
  node.sbom_id = sbom_id;
  node.node_id = "root";
  node.name    = "root";
  graph->AddNode(node);
  return graph;
}

std::size_t Weight() {
  return MakeGraph("g0")->ApproximateSize();
}

void TestBuildsOnceAndShares() {
  GraphCache cache(1 << 20);
  int        builds = 0;
  auto       loader = [&] {
    ++builds;
    return MakeGraph("g1");
  };

  auto first  = cache.GetOrBuild("g1", loader);
  auto second = cache.GetOrBuild("g1", loader);
  assert(first != nullptr);
  assert(first == second);
  assert(builds == 1);
  assert(cache.Len() == 1);
  assert(cache.SizeUsed() == first->ApproximateSize());
  assert(cache.Get("g1") == first);
}

void TestMissingSbomIsNotCached() {
  GraphCache cache(1 << 20);
  auto       graph = cache.GetOrBuild("missing", [] { return GraphCache::GraphPtr{}; });
  assert(graph == nullptr);
  assert(cache.Len() == 0);
  assert(cache.SizeUsed() == 0);
}

void TestFailedBuildIsNotCached() {
  GraphCache cache(1 << 20);

  bool threw = false;
  try {
    (void)cache.GetOrBuild("g1", []() -> GraphCache::GraphPtr { throw util::DataAccessError("connection reset"); });
  } catch (const util::DataAccessError&) {
    threw = true;
  }
  assert(threw && "loader failures must propagate");
  assert(cache.Len() == 0);

  auto graph = cache.GetOrBuild("g1", [] { return MakeGraph("g1"); });
  assert(graph != nullptr);
  assert(cache.Len() == 1);
}

void TestEvictsLeastRecentlyAccessed() {
  const auto weight = Weight();
  GraphCache cache(2 * weight);

  cache.GetOrBuild("g1", [] { return MakeGraph("g1"); });
  cache.GetOrBuild("g2", [] { return MakeGraph("g2"); });
  assert(cache.Get("g1") != nullptr);

  cache.GetOrBuild("g3", [] { return MakeGraph("g3"); });

  assert(cache.Len() == 2);
  assert(cache.SizeUsed() <= cache.MaxSize());
  assert(cache.Get("g1") != nullptr);
  assert(cache.Get("g2") == nullptr);
  assert(cache.Get("g3") != nullptr);
}

void TestEvictionFollowsRecencyOrder() {
  const auto weight = Weight();
  GraphCache cache(3 * weight);

  for (const char* id : {"g1", "g2", "g3"}) cache.GetOrBuild(id, [id] { return MakeGraph(id); });
  assert(cache.Get("g1") != nullptr);
  assert(cache.Get("g2") != nullptr);

  // recency now g2, g1, g3: g3 goes first, then g1
  cache.GetOrBuild("g4", [] { return MakeGraph("g4"); });
  assert(cache.Get("g3") == nullptr);
  cache.GetOrBuild("g5", [] { return MakeGraph("g5"); });
  assert(cache.Get("g1") == nullptr);

  assert(cache.Len() == 3);
  assert(cache.Get("g2") != nullptr);
  assert(cache.Get("g4") != nullptr);
  assert(cache.Get("g5") != nullptr);
}

void TestLongEvictionBurstKeepsNewest() {
  const auto weight = Weight();
  GraphCache cache(weight);

  for (int i = 0; i < 9; ++i) {
    const std::string id = "g" + std::to_string(i);
    cache.GetOrBuild(id, [&id] { return MakeGraph(id); });
    assert(cache.Len() == 1);
    assert(cache.Get(id) != nullptr);
  }
  assert(cache.SizeUsed() == weight);

  cache.Clear();
  cache.GetOrBuild("g1", [] { return MakeGraph("g1"); });
  assert(cache.Len() == 1);
}

void TestEvictionKeepsGraphsInUseAlive() {
  const auto weight = Weight();
  GraphCache cache(weight);

  auto held = cache.GetOrBuild("g1", [] { return MakeGraph("g1"); });
  cache.GetOrBuild("g2", [] { return MakeGraph("g2"); });

  assert(cache.Get("g1") == nullptr);
  assert(held->SbomId() == "g1");
  assert(held->NodeCount() == 1);
}

void TestOversizedGraphIsReturnedButNotKept() {
  GraphCache cache(Weight() - 1);
  auto       graph = cache.GetOrBuild("g1", [] { return MakeGraph("g1"); });
  assert(graph != nullptr);
  assert(cache.Len() == 0);
  assert(cache.SizeUsed() == 0);
}

void TestConcurrentBuildsSettleOnOneCopy() {
  GraphCache       cache(1 << 20);
  std::atomic<int> builds{0};

  std::vector<GraphCache::GraphPtr> results(8);
  std::vector<std::thread>          threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] {
      results[i] = cache.GetOrBuild("shared", [&] {
        builds.fetch_add(1);
        return MakeGraph("shared");
      });
    });
  }
  for (auto& t : threads) t.join();

  assert(builds.load() >= 1);
  assert(cache.Len() == 1);
  for (const auto& graph : results) {
    assert(graph == cache.Get("shared"));
  }
}

void TestClearDropsEverything() {
  GraphCache cache(1 << 20);
  cache.GetOrBuild("g1", [] { return MakeGraph("g1"); });
  cache.GetOrBuild("g2", [] { return MakeGraph("g2"); });
  cache.Clear();
  assert(cache.Len() == 0);
  assert(cache.SizeUsed() == 0);
}

} // namespace

int main() {
  TestBuildsOnceAndShares();
  TestMissingSbomIsNotCached();
  TestFailedBuildIsNotCached();
  TestEvictsLeastRecentlyAccessed();
  TestEvictionFollowsRecencyOrder();
  TestLongEvictionBurstKeepsNewest();
  TestEvictionKeepsGraphsInUseAlive();
  TestOversizedGraphIsReturnedButNotKept();
  TestConcurrentBuildsSettleOnOneCopy();
  TestClearDropsEverything();

  std::cout << "sbomgraph_unit_graph_cache: pass\n";
  return 0;
}
