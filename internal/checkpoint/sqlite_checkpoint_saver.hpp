#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "internal/checkpoint/checkpoint_saver.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace codeintel::checkpoint {

/*
  SQLite checkpoint store (tables: checkpoints, blobs, writes).

  One short-lived connection per call. Multi-statement writes run in a
  BEGIN IMMEDIATE transaction and are serialized per instance; other
  processes or instances on the same file are arbitrated by SQLite.

  keep_latest > 0 prunes the scope after every Put.
*/
class SqliteCheckpointSaver final : public CheckpointSaver {
 public:
  explicit SqliteCheckpointSaver(std::string sqlite_path, std::size_t keep_latest = 0);

  std::optional<CheckpointTuple> GetTuple(const CheckpointConfig& config) const override;

  CheckpointSequence List(const CheckpointConfig&           config,
                          const std::optional<std::string>& before = std::nullopt,
                          std::optional<std::size_t>        limit  = std::nullopt) const override;

  CheckpointConfig Put(const CheckpointConfig&   config,
                       const Checkpoint&         checkpoint,
                       const CheckpointMetadata& metadata,
                       const ChannelVersions&    new_versions) override;

  void PutWrites(const CheckpointConfig&          config,
                 const std::vector<ChannelWrite>& writes,
                 const std::string&               task_id,
                 const std::string&               task_path = "") override;

  void DeleteThread(const std::string& thread_id) override;
  void DeleteThreadNamespace(const std::string& thread_id, const std::string& checkpoint_ns) override;

  std::vector<std::string> ListThreadsNamespace(const std::string& checkpoint_ns) const override;

  std::size_t PruneThreadNamespace(const std::string& thread_id, const std::string& checkpoint_ns, std::size_t keep_latest) override;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> Connect() const;

  std::size_t PruneLocked(const std::shared_ptr<db::sqlite::SqliteDB>& db,
                          const std::string&                           thread_id,
                          const std::string&                           checkpoint_ns,
                          std::size_t                                  keep_latest);

  std::string path_;
  std::size_t keep_latest_;
  std::mutex  write_mutex_;
};

} // namespace codeintel::checkpoint
