#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace sbomgraph::db::postgres {

/*
  PgPool

  Bounded pool of libpqxx connections shared by PgRepository.

  - A transaction holds one connection for its whole lifetime; the
    connection returns to the pool when the last reference drops.
  - libpqxx connections are NOT thread-safe, so a connection is never
    handed to two transactions at once.
  - Every connection has all statements of pg_statements.hpp prepared.
  - Connections found closed (server restart, network loss) are dropped
    instead of being reused.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Blocks while max_connections are in use.
  // Connection failures throw util::DataAccessError.
  std::shared_ptr<pqxx::connection> Acquire();

  // Creates the tables and indexes if they do not exist.
  void BootstrapSchema();

  std::size_t LiveConnections() const;

 private:
  std::unique_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace sbomgraph::db::postgres
