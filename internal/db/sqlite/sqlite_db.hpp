#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace codeintel::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  Stores open one connection per call (open -> operate -> close);
  concurrent connections to the same file are arbitrated by SQLite's
  own locking (WAL + busy timeout).
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Rows modified by the last INSERT/UPDATE/DELETE on this connection
  int Changes() const;

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Creates the parent directory of `path` (sqlite does not).
void EnsureParentDirectory(const std::string& path);

} // namespace codeintel::db::sqlite
