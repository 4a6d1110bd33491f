#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/analysis/expansion_pool.hpp"
#include "internal/util/errors.hpp"

namespace {

using sbomgraph::analysis::ExpansionPool;

void TestResultsComeBackThroughFutures() {
  ExpansionPool pool(4);
  assert(pool.Size() == 4);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 100; ++i) {
    futures.push_back(pool.Submit([i] { return i * i; }));
  }

  long sum = 0;
  for (auto& f : futures) sum += f.get();
  assert(sum == 328350);
}

void TestExceptionsPropagateToCaller() {
  ExpansionPool pool(2);
  auto          failing = pool.Submit([]() -> int { throw sbomgraph::util::DataAccessError("boom"); });
  auto          healthy = pool.Submit([] { return 7; });

  bool threw = false;
  try {
    (void)failing.get();
  } catch (const sbomgraph::util::DataAccessError&) {
    threw = true;
  }
  assert(threw);
  assert(healthy.get() == 7);
}

void TestShutdownDrainsQueuedTasks() {
  std::atomic<int> ran{0};
  {
    ExpansionPool pool(1);
    for (int i = 0; i < 50; ++i) {
      pool.Submit([&] { ran.fetch_add(1); });
    }
    pool.Shutdown();
    assert(ran.load() == 50);

    bool threw = false;
    try {
      pool.Submit([] {});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw && "submitting after shutdown must fail");
  }
  assert(ran.load() == 50);
}

void TestZeroSelectsHardwareConcurrency() {
  ExpansionPool pool(0);
  assert(pool.Size() >= 1);
}

} // namespace

int main() {
  TestResultsComeBackThroughFutures();
  TestExceptionsPropagateToCaller();
  TestShutdownDrainsQueuedTasks();
  TestZeroSelectsHardwareConcurrency();

  std::cout << "sbomgraph_unit_expansion_pool: pass\n";
  return 0;
}
