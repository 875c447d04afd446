#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace codeintel::db::sql {

// Anything that can run a raw SQL script (sqlite connection, test double).
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Schema bootstrap, run by every store on open.

  Statements are applied in order and must be idempotent
  (CREATE ... IF NOT EXISTS). A failure names the schema and the
  statement index.
*/
void RunMigrations(MigrationExecutor& executor, std::string_view schema, const char* const* statements, std::size_t count);

template <std::size_t N>
void RunMigrations(MigrationExecutor& executor, std::string_view schema, const char* const (&statements)[N]) {
  RunMigrations(executor, schema, statements, N);
}

} // namespace codeintel::db::sql
