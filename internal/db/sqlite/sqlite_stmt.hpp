#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"

namespace codeintel::db::sqlite {

/*
  Prepared statement owner. Finalizes on destruction.

  Binding indices are 1-based, column indices 0-based (sqlite convention).
*/
class SqliteStmt {
 public:
  SqliteStmt(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
      throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
    }
  }

  ~SqliteStmt() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  SqliteStmt(const SqliteStmt&)            = delete;
  SqliteStmt& operator=(const SqliteStmt&) = delete;

  sqlite3_stmt* get() {
    return stmt_;
  }

  void BindText(int idx, std::string_view s) {
    sqlite3_bind_text(stmt_, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
  }

  void BindOptionalText(int idx, const std::optional<std::string>& s) {
    if (s) {
      BindText(idx, *s);
    } else {
      sqlite3_bind_null(stmt_, idx);
    }
  }

  void BindBlob(int idx, const std::string& bytes) {
    sqlite3_bind_blob(stmt_, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
  }

  void BindInt64(int idx, int64_t v) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
  }

  void BindU64(int idx, uint64_t v) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
  }

  // true on SQLITE_ROW, false on SQLITE_DONE, throws on anything else
  bool Next() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(db_)));
  }

  // Executes a statement that returns no rows.
  Result Run() {
    return Translate(db_, sqlite3_step(stmt_));
  }

  // Rebinds for the next row of a batch insert.
  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  std::string ColText(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col))) : "";
  }

  std::optional<std::string> ColOptionalText(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return ColText(col);
  }

  std::string ColBlob(int col) const {
    const void* data = sqlite3_column_blob(stmt_, col);
    const int   size = sqlite3_column_bytes(stmt_, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
  }

  int64_t ColInt64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
  }

  uint64_t ColU64(int col) const {
    return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
  }

  static Result Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
      return Result::Ok();

    switch (rc & 0xFF) {
      case SQLITE_BUSY:
      case SQLITE_LOCKED:
        return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
      case SQLITE_CONSTRAINT:
        return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
      case SQLITE_IOERR:
        return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
      case SQLITE_CORRUPT:
        return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
      default:
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
  }

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace codeintel::db::sqlite
