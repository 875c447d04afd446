#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/graph/graph_store.hpp"

namespace codeintel::graph {

/*
  SQLite-backed graph store.

  Each call opens its own connection; schema is bootstrapped once at
  construction. Writes are serialized per store instance, readers run
  concurrently under WAL.
*/
class SqliteGraphStore final : public GraphStore {
 public:
  explicit SqliteGraphStore(std::string sqlite_path);

  GraphStats Rebuild(const ProjectScope& scope, const std::vector<v1::CodeBlock>& blocks) override;

  std::string OverviewText(const ProjectScope& scope, int limit = 25) const override;
  std::string NeighborsText(const ProjectScope& scope, const std::string& node_id, int depth = 1, int limit = 60) const override;

  FileDependencies GetFileDependencies(const ProjectScope& scope) const override;

  std::optional<FileStatusRecord> GetFileStatus(const ProjectScope& scope, const std::string& file_path) const override;
  void                            UpdateFileStatus(const ProjectScope& scope, const FileStatusRecord& record) override;
  std::vector<FileStatusRecord>   ListFileStatuses(const ProjectScope& scope) const override;

  std::optional<IndexingJobRecord> GetIndexingJob(const ProjectScope& scope) const override;
  void                             UpdateIndexingJob(const ProjectScope& scope, const IndexingJobRecord& record) override;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> Connect() const;

  std::string path_;
  std::mutex  write_mutex_;
};

} // namespace codeintel::graph
