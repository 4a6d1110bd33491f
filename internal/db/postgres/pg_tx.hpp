#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace sbomgraph::db::postgres {

/*
  Write transactions wrap pqxx::work, read transactions
  pqxx::read_transaction. Both hold their pooled connection until
  destroyed.
*/
class PgTransaction final : public db::Transaction {
public:
  enum class Mode { kRead, kWrite };

  PgTransaction(std::shared_ptr<PgPool> pool, Mode mode);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsReadOnly() const override { return mode_ == Mode::kRead; }

private:
  Mode mode_;
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool committed_ = false;
};

} // namespace sbomgraph::db::postgres
