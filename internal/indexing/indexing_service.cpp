#include "internal/indexing/indexing_service.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace codeintel::indexing {

using observability::CountField;
using observability::StringField;

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime  = 1099511628211ULL;

uint64_t Fnv1a(uint64_t hash, const std::string& data) {
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string Hex64(uint64_t v) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
  return buf;
}

const std::string& FileOf(const v1::CodeBlock& block) {
  static const std::string unknown = graph::kUnknownFile;
  return block.file_path().empty() ? unknown : block.file_path();
}

} // namespace

std::map<std::string, std::string> HashFiles(const std::vector<v1::CodeBlock>& blocks) {
  std::map<std::string, uint64_t> state;
  for (const auto& block : blocks) {
    auto it = state.emplace(FileOf(block), kFnvOffset).first;
    // NUL separates blocks so moving code across a boundary changes the hash
    it->second = Fnv1a(Fnv1a(it->second, block.code()), std::string(1, '\0'));
  }

  std::map<std::string, std::string> out;
  for (const auto& [file, hash] : state) {
    out.emplace(file, Hex64(hash));
  }
  return out;
}

IndexingService::IndexingService(std::shared_ptr<graph::GraphStore> graph_store, std::shared_ptr<VectorIndex> vector_index)
    : graph_store_(std::move(graph_store)), vector_index_(std::move(vector_index)) {
  if (!graph_store_) {
    throw util::InvalidArgument("IndexingService: graph store is required");
  }
}

std::string IndexingService::Reindex(const graph::ProjectScope& project, std::vector<v1::CodeBlock> blocks, bool include_file_summaries) {
  std::lock_guard lock(indexing_mutex_);

  const auto scope = graph::NormalizeScope(project);
  const auto label = scope.value_or("(default)");

  graph::IndexingJobRecord job;
  job.status        = "in_progress";
  job.started_at_ms = util::ToUnixMillis(util::Now());
  job.step          = "scan";

  if (blocks.empty()) {
    CODEINTEL_LOG_WARN("no code blocks to index", {StringField("project", label)});
    job.status         = "done";
    job.step           = "done";
    job.finished_at_ms = util::ToUnixMillis(util::Now());
    graph_store_->UpdateIndexingJob(scope, job);
    return "No code blocks found.";
  }

  if (scope) {
    for (auto& block : blocks) block.set_project(*scope);
  }

  const auto hashes = HashFiles(blocks);
  job.total_files   = hashes.size();
  graph_store_->UpdateIndexingJob(scope, job);

  CODEINTEL_LOG_INFO("reindex started",
                     {StringField("project", label), CountField("blocks", blocks.size()),
                      CountField("files", hashes.size())});

  try {
    if (vector_index_) {
      job.step = "vector_index";
      graph_store_->UpdateIndexingJob(scope, job);
      vector_index_->IndexCodeBlocks(blocks);
      if (include_file_summaries) vector_index_->IndexFileSummaries(blocks);
      vector_index_->Persist();
    }

    job.step = "graph";
    graph_store_->UpdateIndexingJob(scope, job);
    graph_store_->Rebuild(scope, blocks);

    job.step = "file_status";
    graph_store_->UpdateIndexingJob(scope, job);
    const auto now = util::ToUnixMillis(util::Now());
    for (const auto& [file, hash] : hashes) {
      graph_store_->UpdateFileStatus(scope, graph::FileStatusRecord{file, hash, "indexed", now});
      ++job.processed_files;
    }
  } catch (const std::exception& e) {
    job.status         = "failed";
    job.error          = e.what();
    job.finished_at_ms = util::ToUnixMillis(util::Now());
    graph_store_->UpdateIndexingJob(scope, job);
    CODEINTEL_LOG_ERROR("reindex failed", {StringField("project", label), StringField("step", job.step), StringField("error", e.what())});
    throw;
  }

  job.status         = "done";
  job.step           = "done";
  job.finished_at_ms = util::ToUnixMillis(util::Now());
  graph_store_->UpdateIndexingJob(scope, job);

  CODEINTEL_LOG_INFO("reindex finished",
                     {StringField("project", label), CountField("elapsed_ms", job.finished_at_ms - job.started_at_ms)});
  return graph_store_->OverviewText(scope);
}

std::vector<std::string> IndexingService::ChangedFiles(const graph::ProjectScope& project, const std::vector<v1::CodeBlock>& blocks) const {
  const auto scope = graph::NormalizeScope(project);

  std::map<std::string, std::string> stored;
  for (auto& record : graph_store_->ListFileStatuses(scope)) {
    stored.emplace(std::move(record.file_path), std::move(record.file_hash));
  }

  std::vector<std::string> changed;
  for (const auto& [file, hash] : HashFiles(blocks)) {
    auto it = stored.find(file);
    if (it == stored.end() || it->second != hash) changed.push_back(file);
  }
  return changed;
}

} // namespace codeintel::indexing
