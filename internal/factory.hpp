#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/checkpoint/checkpoint_saver.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/indexing/indexing_service.hpp"
#include "internal/jobs/job_coordinator.hpp"

namespace codeintel::factory {

/*
  Runtime

  Long-lived stores and services built from one RuntimeConfig.
*/
struct Runtime {
  std::shared_ptr<graph::GraphStore>           graph_store;
  std::shared_ptr<checkpoint::CheckpointSaver> checkpoint_saver;
  std::shared_ptr<indexing::IndexingService>   indexing;
};

/*
  Build

  Composition root: the only place that knows the concrete SQLite types.
*/
Runtime Build(const codeintel::runtime::config::RuntimeConfig& config,
              std::shared_ptr<indexing::VectorIndex>           vector_index = nullptr);

jobs::JobOptions JobOptionsFromConfig(const codeintel::runtime::config::RuntimeConfig& config);

// The parser and documenter are supplied by the embedding service.
std::unique_ptr<jobs::JobCoordinator> BuildJobCoordinator(const codeintel::runtime::config::RuntimeConfig& config,
                                                          std::shared_ptr<const jobs::MemberSource>        source,
                                                          std::shared_ptr<jobs::MemberDocumenter>          documenter);

} // namespace codeintel::factory
