#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codeintel/v1.hpp"
#include "internal/graph/graph_model.hpp"

namespace codeintel::graph {

/*
  Project-scoped call-graph storage.

  Every operation takes the project scope explicitly; nullopt selects the
  unscoped project. Queries on empty or unknown scopes return zero counts
  and empty reports, never errors.
*/
class GraphStore {
 public:
  virtual ~GraphStore() = default;

  // Replaces all nodes and edges of `scope` with the graph built from `blocks`.
  virtual GraphStats Rebuild(const ProjectScope& scope, const std::vector<v1::CodeBlock>& blocks) = 0;

  virtual std::string OverviewText(const ProjectScope& scope, int limit = 25) const = 0;

  // Bounded two-way walk over calls edges starting at `node_id`.
  virtual std::string NeighborsText(const ProjectScope& scope, const std::string& node_id, int depth = 1, int limit = 60) const = 0;

  virtual FileDependencies GetFileDependencies(const ProjectScope& scope) const = 0;

  // ---- incremental indexing bookkeeping ----

  virtual std::optional<FileStatusRecord> GetFileStatus(const ProjectScope& scope, const std::string& file_path) const = 0;
  virtual void                            UpdateFileStatus(const ProjectScope& scope, const FileStatusRecord& record) = 0;
  virtual std::vector<FileStatusRecord>   ListFileStatuses(const ProjectScope& scope) const = 0;

  virtual std::optional<IndexingJobRecord> GetIndexingJob(const ProjectScope& scope) const = 0;
  virtual void                             UpdateIndexingJob(const ProjectScope& scope, const IndexingJobRecord& record) = 0;
};

} // namespace codeintel::graph
