#include "internal/db/sqlite/sqlite_tx.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace codeintel::db::sqlite {

using observability::StringField;

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CODEINTEL_LOG_WARN("sqlite rollback failed", {StringField("path", db_->Path()), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

} // namespace codeintel::db::sqlite
