#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

namespace codeintel::db::sql {

void RunMigrations(MigrationExecutor& executor, std::string_view schema, const char* const* statements, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    try {
      executor.ExecuteSQL(statements[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string(schema) + " schema statement " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

} // namespace codeintel::db::sql
