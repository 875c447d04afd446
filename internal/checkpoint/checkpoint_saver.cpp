#include "internal/checkpoint/checkpoint_saver.hpp"

#include <utility>

namespace codeintel::checkpoint {

CheckpointSequence::CheckpointSequence(const CheckpointSaver& saver, CheckpointConfig scope, std::vector<std::string> ids)
    : saver_(&saver), scope_(std::move(scope)), ids_(std::move(ids)) {
}

std::optional<CheckpointTuple> CheckpointSequence::Next() {
  while (pos_ < ids_.size()) {
    CheckpointConfig config = scope_;
    config.checkpoint_id    = ids_[pos_++];
    if (auto tuple = saver_->GetTuple(config)) {
      return tuple;
    }
  }
  return std::nullopt;
}

} // namespace codeintel::checkpoint
