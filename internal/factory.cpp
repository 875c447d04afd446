#include "internal/factory.hpp"

#include <utility>

#include "internal/checkpoint/sqlite_checkpoint_saver.hpp"
#include "internal/graph/sqlite_graph_store.hpp"
#include "internal/observability/logging.hpp"

namespace codeintel::factory {

using codeintel::runtime::config::RuntimeConfig;
using observability::StringField;

Runtime Build(const RuntimeConfig& config, std::shared_ptr<indexing::VectorIndex> vector_index) {
  Runtime runtime;

  const auto& storage = config.storage();

  runtime.graph_store      = std::make_shared<graph::SqliteGraphStore>(storage.graph_db_path());
  runtime.checkpoint_saver = std::make_shared<checkpoint::SqliteCheckpointSaver>(storage.checkpoint_db_path(), config.checkpoints().keep_latest());
  runtime.indexing         = std::make_shared<indexing::IndexingService>(runtime.graph_store, std::move(vector_index));

  CODEINTEL_LOG_DEBUG("runtime built",
                      {StringField("graph_db", storage.graph_db_path()), StringField("checkpoint_db", storage.checkpoint_db_path())});
  return runtime;
}

jobs::JobOptions JobOptionsFromConfig(const RuntimeConfig& config) {
  const auto& cfg = config.jobs();

  jobs::JobOptions options;
  if (cfg.min_meaningful_lines() > 0) options.min_meaningful_lines = static_cast<int>(cfg.min_meaningful_lines());
  if (cfg.max_code_chars() > 0) options.max_code_chars = cfg.max_code_chars();
  if (cfg.has_exclude_tests()) options.exclude_tests = cfg.exclude_tests();
  if (cfg.source_extensions_size() > 0) {
    options.source_extensions.assign(cfg.source_extensions().begin(), cfg.source_extensions().end());
  }
  return options;
}

std::unique_ptr<jobs::JobCoordinator> BuildJobCoordinator(const RuntimeConfig&                      config,
                                                          std::shared_ptr<const jobs::MemberSource> source,
                                                          std::shared_ptr<jobs::MemberDocumenter>   documenter) {
  jobs::JobCoordinatorConfig cfg;
  if (!config.jobs().log_dir().empty()) cfg.log_dir = config.jobs().log_dir();
  cfg.max_finished_jobs = config.jobs().max_finished_jobs();
  return std::make_unique<jobs::JobCoordinator>(std::move(source), std::move(documenter), std::move(cfg));
}

} // namespace codeintel::factory
