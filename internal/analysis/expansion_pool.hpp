#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace sbomgraph::analysis {

/*
  Fixed-size worker pool for blocking data access and graph expansion.

  Thread-safe blocking queue feeding std::thread workers. Results and
  exceptions come back through std::future.

  Tasks must not wait on other tasks of the same pool.
*/
class ExpansionPool {
 public:
  // workers == 0 selects the hardware concurrency
  explicit ExpansionPool(std::size_t workers);
  ~ExpansionPool();

  ExpansionPool(const ExpansionPool&)            = delete;
  ExpansionPool& operator=(const ExpansionPool&) = delete;

  template <typename F>
  auto Submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
    using R   = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto fut  = task->get_future();
    Enqueue([task] { (*task)(); });
    return fut;
  }

  std::size_t Size() const {
    return threads_.size();
  }

  // Drains queued tasks, then joins the workers.
  void Shutdown();

 private:
  void Enqueue(std::function<void()> job);
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> queue_;
  bool                              shutdown_ = false;
  std::vector<std::thread>          threads_;
};

} // namespace sbomgraph::analysis
