#include "pg_pool.hpp"

#include "internal/db/postgres/pg_statements.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sbomgraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) return Wrap(conn.release());

      --live_connections_;
      SBOMGRAPH_LOG_WARN("dropping closed postgres connection");
    }

    if (live_connections_ < max_connections_) break;

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }

  // reserve the slot, connect outside the lock
  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(Connect().release());
  } catch (const pqxx::failure& e) {
    {
      std::lock_guard relock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw util::DataAccessError(std::string("postgres connect: ") + e.what());
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& [name, sql] : Statements()) {
    conn->prepare(name, sql::NumberPlaceholders(sql));
  }
  return conn;
}

void PgPool::BootstrapSchema() {
  auto conn = Acquire();
  try {
    pqxx::work tx(*conn);
    for (const auto& stmt : sql::SchemaStatements()) tx.exec(stmt);
    tx.commit();
  } catch (const pqxx::failure& e) {
    throw util::DataAccessError(std::string("postgres schema: ") + e.what());
  }
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace sbomgraph::db::postgres
