#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "codeintel/v1.hpp"
#include "internal/graph/graph_store.hpp"

namespace codeintel::indexing {

// Embedding-backed similarity index fed on every reindex.
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  virtual void IndexCodeBlocks(const std::vector<v1::CodeBlock>& blocks)    = 0;
  virtual void IndexFileSummaries(const std::vector<v1::CodeBlock>& blocks) = 0;
  virtual void Persist()                                                     = 0;
};

// file path -> FNV-1a content hash (16 hex digits) of its blocks' code
std::map<std::string, std::string> HashFiles(const std::vector<v1::CodeBlock>& blocks);

/*
  Full reindex of one project: vector index, call graph, per-file
  bookkeeping. Reindexes are serialized per service instance; progress
  is recorded in the project's indexing_jobs row.
*/
class IndexingService {
 public:
  explicit IndexingService(std::shared_ptr<graph::GraphStore> graph_store, std::shared_ptr<VectorIndex> vector_index = nullptr);

  // Returns the project overview after the rebuild.
  std::string Reindex(const graph::ProjectScope& project, std::vector<v1::CodeBlock> blocks, bool include_file_summaries = true);

  // Files whose content hash differs from the last indexed one (or were never indexed).
  std::vector<std::string> ChangedFiles(const graph::ProjectScope& project, const std::vector<v1::CodeBlock>& blocks) const;

 private:
  std::shared_ptr<graph::GraphStore> graph_store_;
  std::shared_ptr<VectorIndex>       vector_index_;
  std::mutex                         indexing_mutex_;
};

} // namespace codeintel::indexing
