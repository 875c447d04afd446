#include <iostream>
#include <string>

#include "internal/checkpoint/sqlite_checkpoint_saver.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

using codeintel::checkpoint::ChannelVersions;
using codeintel::checkpoint::Checkpoint;
using codeintel::checkpoint::CheckpointConfig;
using codeintel::checkpoint::CheckpointMetadata;
using codeintel::checkpoint::NewCheckpointId;
using codeintel::checkpoint::TypedValue;

namespace {

Checkpoint MakeStep(const std::string& messages_version, const std::string& messages_json) {
  Checkpoint checkpoint;
  checkpoint.body.set_v(1);
  checkpoint.body.set_id(NewCheckpointId());
  (*checkpoint.body.mutable_channel_versions())["messages"] = messages_version;
  checkpoint.body.add_updated_channels("messages");
  checkpoint.channel_values["messages"] = TypedValue{"json", messages_json};
  return checkpoint;
}

} // namespace

int main(int argc, char** argv) {
  // Database path can be passed on the command line; defaults to a local file.
  const std::string path = argc > 1 ? argv[1] : "./data/example_checkpoints.sqlite3";

  auto config = codeintel::config::ConfigLoader::Defaults();
  codeintel::observability::InitializeLogging(config);

  try {
    // keep the three newest checkpoints of every thread
    codeintel::checkpoint::SqliteCheckpointSaver saver(path, 3);

    CheckpointConfig conversation{"example-thread", "", std::nullopt};
    std::string      history = "[";
    for (int step = 0; step < 5; ++step) {
      if (step > 0) history += ",";
      history += "\"turn " + std::to_string(step) + "\"";

      CheckpointMetadata metadata;
      metadata.set_source(step == 0 ? "input" : "loop");
      metadata.set_step(step - 1);

      const auto version = std::to_string(step + 1);
      conversation       = saver.Put(conversation, MakeStep(version, history + "]"), metadata, ChannelVersions{{"messages", version}});
    }

    // a task's output recorded before the next checkpoint exists
    saver.PutWrites(conversation, {{"messages", TypedValue{"json", "\"pending turn\""}}}, "task-1");

    const auto latest = saver.GetTuple({"example-thread", "", std::nullopt});
    if (!latest) {
      std::cerr << "no checkpoint stored\n";
      return 1;
    }
    std::cout << "latest checkpoint: " << *latest->config.checkpoint_id << "\n";
    std::cout << "messages: " << latest->checkpoint.channel_values.at("messages").payload << "\n";
    std::cout << "pending writes: " << latest->pending_writes.size() << "\n";

    auto history_view = saver.List({"example-thread", "", std::nullopt});
    std::cout << "retained checkpoints: " << history_view.Size() << "\n";
    while (auto tuple = history_view.Next()) {
      std::cout << "  " << *tuple->config.checkpoint_id << " step=" << tuple->metadata.step() << "\n";
    }

    saver.DeleteThread("example-thread");
  } catch (const std::exception& e) {
    CODEINTEL_LOG_ERROR("checkpoint example failed", {codeintel::observability::StringField("error", e.what())});
    codeintel::observability::ShutdownLogging();
    return 2;
  }

  codeintel::observability::ShutdownLogging();
  return 0;
}
