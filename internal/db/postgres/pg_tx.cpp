#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sbomgraph::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, Mode mode) : mode_(mode)
{
  conn_ = pool->Acquire();
  try {
    if (mode == Mode::kWrite) {
      tx_ = std::make_unique<pqxx::work>(*conn_);
    } else {
      tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
    }
  } catch (const pqxx::failure& e) {
    throw util::DataAccessError(std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      SBOMGRAPH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    throw util::DataAccessError(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

} // namespace sbomgraph::db::postgres
