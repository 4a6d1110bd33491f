#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace sbomgraph::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Read transactions use BEGIN DEFERRED and, under WAL, see the snapshot
  taken at their first read without blocking writers.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kRead, kWrite };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsReadOnly() const override { return mode_ == Mode::kRead; }

private:
  std::shared_ptr<SqliteDB> db_;
  Mode mode_;
  bool committed_ = false;
};

} // namespace sbomgraph::db::sqlite
