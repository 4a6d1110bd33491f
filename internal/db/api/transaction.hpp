#pragma once

namespace sbomgraph::db {

/*
  Unit of work against a repository.

  Ingestion writes one or more SBOM documents inside a Begin()
  transaction; analysis requests read through BeginRead() transactions,
  one per expansion task, concurrently with each other and with an
  ingestion in progress.

  Every backend guarantees:

  - Writes become visible to new transactions at Commit(), all at once
  - Destruction without Commit() rolls back
  - A read transaction never observes a half-committed document
  - Writes through a read transaction fail with ErrorCode::ReadOnly

  SQLite:   BEGIN IMMEDIATE / BEGIN DEFERRED on a private connection
  Postgres: pqxx::work / pqxx::read_transaction on a pooled connection
  Memory:   copy-on-write snapshot of the committed state
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

} // namespace sbomgraph::db
