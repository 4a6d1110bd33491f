#pragma once

#include <sqlite3.h>

#include <string>

namespace sbomgraph::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The repository opens one connection per transaction so read
  transactions of concurrent expansions never share a handle.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  const std::string& Path() const {
    return path_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace sbomgraph::db::sqlite
