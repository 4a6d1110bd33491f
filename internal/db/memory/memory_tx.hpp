#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace sbomgraph::db::memory {

/*
  Transaction = snapshot + write set

  The write set is copied from the snapshot on first mutation only, so
  read transactions cost a reference count.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  // throws std::logic_error on read transactions
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::optional<MemoryRepository::State>         working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           read_only_        = false;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace sbomgraph::db::memory
