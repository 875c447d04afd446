#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "codeintel/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using codeintel::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  codeintelctl [--config <file.yaml>] graph-rebuild <blocks.jsonl> [project]\n"
            << "  codeintelctl [--config <file.yaml>] graph-overview [project] [limit]\n"
            << "  codeintelctl [--config <file.yaml>] graph-neighbors <node_id> [project] [depth] [limit]\n"
            << "  codeintelctl [--config <file.yaml>] graph-deps [project]\n"
            << "  codeintelctl [--config <file.yaml>] threads <checkpoint_ns>\n"
            << "  codeintelctl [--config <file.yaml>] checkpoints <thread_id> <checkpoint_ns> [limit]\n"
            << "  codeintelctl [--config <file.yaml>] delete-thread <thread_id> [checkpoint_ns]\n"
            << "  codeintelctl [--config <file.yaml>] prune <thread_id> <checkpoint_ns> [keep]\n"
            << "\n"
            << "An empty project argument (\"\") selects the unscoped project.\n";
}

static std::optional<std::string> Arg(const std::vector<std::string>& args, std::size_t i) {
  if (i < args.size()) return args[i];
  return std::nullopt;
}

static int IntArg(const std::vector<std::string>& args, std::size_t i, int fallback) {
  return i < args.size() ? std::stoi(args[i]) : fallback;
}

static std::vector<codeintel::v1::CodeBlock> ReadBlocks(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw codeintel::util::NotFound("cannot open " + path);
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  std::vector<codeintel::v1::CodeBlock> blocks;
  std::string                           line;
  std::size_t                           line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    codeintel::v1::CodeBlock block;
    auto                     status = google::protobuf::util::JsonStringToMessage(line, &block, options);
    if (!status.ok()) {
      throw codeintel::util::InvalidArgument(path + ":" + std::to_string(line_no) + ": " + status.ToString());
    }
    blocks.push_back(std::move(block));
  }
  return blocks;
}

static int RunCommand(const RuntimeConfig& config, const std::string& cmd, const std::vector<std::string>& args) {
  auto runtime = codeintel::factory::Build(config);

  // ------------------------------------------------------------
  // Graph
  // ------------------------------------------------------------

  if (cmd == "graph-rebuild") {
    if (args.empty()) {
      Usage();
      return 1;
    }
    auto blocks = ReadBlocks(args[0]);
    std::cout << runtime.indexing->Reindex(Arg(args, 1), std::move(blocks)) << "\n";
    return 0;
  }

  if (cmd == "graph-overview") {
    std::cout << runtime.graph_store->OverviewText(Arg(args, 0), IntArg(args, 1, 25)) << "\n";
    return 0;
  }

  if (cmd == "graph-neighbors") {
    if (args.empty()) {
      Usage();
      return 1;
    }
    std::cout << runtime.graph_store->NeighborsText(Arg(args, 1), args[0], IntArg(args, 2, 1), IntArg(args, 3, 60)) << "\n";
    return 0;
  }

  if (cmd == "graph-deps") {
    for (const auto& [file, targets] : runtime.graph_store->GetFileDependencies(Arg(args, 0))) {
      std::cout << file << "\n";
      for (const auto& target : targets) {
        std::cout << "  -> " << target << "\n";
      }
    }
    return 0;
  }

  // ------------------------------------------------------------
  // Checkpoints
  // ------------------------------------------------------------

  if (cmd == "threads") {
    for (const auto& thread_id : runtime.checkpoint_saver->ListThreadsNamespace(Arg(args, 0).value_or(""))) {
      std::cout << thread_id << "\n";
    }
    return 0;
  }

  if (cmd == "checkpoints") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }
    std::optional<std::size_t> limit;
    if (args.size() >= 3) limit = static_cast<std::size_t>(std::stoul(args[2]));

    auto sequence = runtime.checkpoint_saver->List({args[0], args[1], std::nullopt}, std::nullopt, limit);
    while (auto tuple = sequence.Next()) {
      std::cout << *tuple->config.checkpoint_id << "\tparent="
                << (tuple->parent_config ? tuple->parent_config->checkpoint_id.value_or("") : std::string("-"))
                << "\tsource=" << tuple->metadata.source() << "\tstep=" << tuple->metadata.step()
                << "\tchannels=" << tuple->checkpoint.channel_values.size()
                << "\tpending_writes=" << tuple->pending_writes.size() << "\n";
    }
    return 0;
  }

  if (cmd == "delete-thread") {
    if (args.empty()) {
      Usage();
      return 1;
    }
    if (args.size() >= 2) {
      runtime.checkpoint_saver->DeleteThreadNamespace(args[0], args[1]);
    } else {
      runtime.checkpoint_saver->DeleteThread(args[0]);
    }
    std::cout << "deleted " << args[0] << "\n";
    return 0;
  }

  if (cmd == "prune") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }
    std::size_t keep = config.checkpoints().keep_latest();
    if (args.size() >= 3) keep = static_cast<std::size_t>(std::stoul(args[2]));

    const auto removed = runtime.checkpoint_saver->PruneThreadNamespace(args[0], args[1], keep);
    std::cout << "removed " << removed << " checkpoint(s)\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];
  args.erase(args.begin());

  try {
    RuntimeConfig config;
    if (config_path) {
      config = codeintel::config::ConfigLoader::LoadFromYaml(*config_path);
    } else {
      config = codeintel::config::ConfigLoader::Defaults();
      codeintel::config::ConfigLoader::ApplyEnvironment(config);
    }
    codeintel::observability::InitializeLogging(config);

    const int rc = RunCommand(config, cmd, args);
    codeintel::observability::ShutdownLogging();
    return rc;
  } catch (const codeintel::util::InvalidArgument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
  } catch (const codeintel::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const std::exception& e) {
    CODEINTEL_LOG_ERROR("command failed", {codeintel::observability::StringField("command", cmd), codeintel::observability::StringField("error", e.what())});
    codeintel::observability::ShutdownLogging();
    return 2;
  }
  codeintel::observability::ShutdownLogging();
  return 1;
}
