#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sbomgraph::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw std::logic_error("write attempted in a read-only transaction");
  }
  if (!working_) {
    working_ = *snapshot_; // copy on first write
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::DataAccessError("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::make_shared<const MemoryRepository::State>(std::move(*working_));
  repo_.committed_version_++;
  working_.reset();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace sbomgraph::db::memory
