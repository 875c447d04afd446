#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "codeintel/v1.hpp"

namespace codeintel::checkpoint {

/*
  Conversation checkpoint model.

  Channel values and pending-write values are opaque to the store: the
  agent runtime hands them over already serialized as (type tag, payload).
  The checkpoint body and metadata are protobuf messages.
*/

// Type tag of an unset channel value.
inline constexpr const char* kEmptyValueType = "empty";

// Type tag of protobuf-serialized bodies and metadata.
inline constexpr const char* kProtobufValueType = "protobuf";

struct TypedValue {
  std::string type;
  std::string payload;

  bool IsEmpty() const {
    return type == kEmptyValueType;
  }

  bool operator==(const TypedValue&) const = default;
};

// channel -> version token
using ChannelVersions = std::map<std::string, std::string>;

using CheckpointMetadata = v1::CheckpointMetadata;

struct CheckpointConfig {
  std::string                thread_id;
  std::string                checkpoint_ns;
  std::optional<std::string> checkpoint_id;
};

struct Checkpoint {
  // id, ts, channel_versions, versions_seen, updated_channels
  v1::CheckpointBody                body;
  std::map<std::string, TypedValue> channel_values;
};

struct ChannelWrite {
  std::string channel;
  TypedValue  value;
};

struct PendingWrite {
  std::string task_id;
  std::string channel;
  TypedValue  value;
  std::string task_path;
};

struct CheckpointTuple {
  CheckpointConfig                config;
  Checkpoint                      checkpoint;
  CheckpointMetadata              metadata;
  std::optional<CheckpointConfig> parent_config;
  std::vector<PendingWrite>       pending_writes; // ordered by (task_id, write index)
};

// Special write channels and the fixed write index each one occupies.
inline constexpr const char* kErrorChannel     = "__error__";
inline constexpr const char* kScheduledChannel = "__scheduled__";
inline constexpr const char* kInterruptChannel = "__interrupt__";
inline constexpr const char* kResumeChannel    = "__resume__";

std::optional<int> ReservedWriteIndex(const std::string& channel);

// Time-ordered id: <unix micros as 16 hex digits>-<8 random hex digits>.
std::string NewCheckpointId();

} // namespace codeintel::checkpoint
