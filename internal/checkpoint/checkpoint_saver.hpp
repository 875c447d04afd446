#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/checkpoint/checkpoint_model.hpp"

namespace codeintel::checkpoint {

class CheckpointSaver;

/*
  Lazily materialized listing result.

  Holds the ids selected at List() time and fetches one tuple per Next().
  Checkpoints deleted in between are skipped. Rewind() restarts from the
  newest id; the sequence must not outlive its saver.
*/
class CheckpointSequence {
 public:
  CheckpointSequence(const CheckpointSaver& saver, CheckpointConfig scope, std::vector<std::string> ids);

  std::optional<CheckpointTuple> Next();

  void Rewind() {
    pos_ = 0;
  }

  std::size_t Size() const {
    return ids_.size();
  }

  const std::vector<std::string>& Ids() const {
    return ids_;
  }

 private:
  const CheckpointSaver*   saver_;
  CheckpointConfig         scope_;
  std::vector<std::string> ids_;
  std::size_t              pos_ = 0;
};

/*
  Versioned, append-only conversation state.

  Reads never throw for absence. An empty thread_id is rejected with
  util::InvalidArgument everywhere it is required.
*/
class CheckpointSaver {
 public:
  virtual ~CheckpointSaver() = default;

  // Exact checkpoint when config.checkpoint_id is set, latest otherwise.
  virtual std::optional<CheckpointTuple> GetTuple(const CheckpointConfig& config) const = 0;

  // Ids strictly older than `before` (if set), newest first, at most `limit`.
  // An empty thread_id lists nothing.
  virtual CheckpointSequence List(const CheckpointConfig&        config,
                                  const std::optional<std::string>& before = std::nullopt,
                                  std::optional<std::size_t>        limit  = std::nullopt) const = 0;

  // Stores `checkpoint` as a child of config.checkpoint_id. Only channels
  // listed in `new_versions` get a blob written.
  virtual CheckpointConfig Put(const CheckpointConfig&   config,
                               const Checkpoint&         checkpoint,
                               const CheckpointMetadata& metadata,
                               const ChannelVersions&    new_versions) = 0;

  virtual void PutWrites(const CheckpointConfig&          config,
                         const std::vector<ChannelWrite>& writes,
                         const std::string&               task_id,
                         const std::string&               task_path = "") = 0;

  virtual void DeleteThread(const std::string& thread_id) = 0;
  virtual void DeleteThreadNamespace(const std::string& thread_id, const std::string& checkpoint_ns) = 0;

  virtual std::vector<std::string> ListThreadsNamespace(const std::string& checkpoint_ns) const = 0;

  // Keeps the newest `keep_latest` checkpoints of the scope; returns how many were removed.
  virtual std::size_t PruneThreadNamespace(const std::string& thread_id, const std::string& checkpoint_ns, std::size_t keep_latest) = 0;
};

} // namespace codeintel::checkpoint
