#include "internal/analysis/expansion_pool.hpp"

namespace sbomgraph::analysis {

ExpansionPool::ExpansionPool(std::size_t workers) {
  if (workers == 0) workers = std::thread::hardware_concurrency();
  if (workers == 0) workers = 1;

  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&ExpansionPool::Run, this);
  }
}

ExpansionPool::~ExpansionPool() {
  Shutdown();
}

void ExpansionPool::Enqueue(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw std::runtime_error("expansion pool is shut down");
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

void ExpansionPool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void ExpansionPool::Run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

      if (shutdown_ && queue_.empty()) return;

      job = std::move(queue_.front());
      queue_.pop();
    }

    // packaged_task stores any exception in the future
    job();
  }
}

} // namespace sbomgraph::analysis
