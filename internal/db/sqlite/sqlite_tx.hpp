#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace codeintel::db::sqlite {

/*
  Scoped write transaction (BEGIN IMMEDIATE).

  The write lock is taken up front, so two writers on one file queue on
  the busy timeout instead of failing at COMMIT. Anything not committed
  is rolled back when the scope ends, including on exceptions.

  Holds the connection alive for its own lifetime.
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_ = false;
};

} // namespace codeintel::db::sqlite
