#include "internal/indexing/indexing_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/factory.hpp"
#include "internal/graph/sqlite_graph_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using codeintel::graph::SqliteGraphStore;
using codeintel::indexing::HashFiles;
using codeintel::indexing::IndexingService;
using codeintel::indexing::VectorIndex;
using codeintel::testing::TempDir;
using codeintel::v1::CodeBlock;

CodeBlock MakeBlock(const std::string& id, const std::string& signature, const std::vector<std::string>& calls, const std::string& file_path, const std::string& code) {
  CodeBlock block;
  block.set_id(id);
  block.set_signature(signature);
  for (const auto& call : calls) block.add_calls(call);
  block.set_file_path(file_path);
  block.set_code(code);
  block.set_type("method");
  return block;
}

std::vector<CodeBlock> SampleBlocks() {
  return {
      MakeBlock("Svc.handle", "void handle(Request r)", {"validate", "store"}, "src/Svc.java", "void handle(Request r) { validate(r); store(r); }"),
      MakeBlock("Svc.validate", "boolean validate(Request r)", {}, "src/Svc.java", "boolean validate(Request r) { return r != null; }"),
      MakeBlock("Repo.store", "void store(Request r)", {}, "src/Repo.java", "void store(Request r) { rows.add(r); }"),
  };
}

class RecordingVectorIndex : public VectorIndex {
 public:
  void IndexCodeBlocks(const std::vector<CodeBlock>& blocks) override {
    std::lock_guard lock(mutex_);
    calls_.push_back("blocks");
    last_blocks_ = blocks;
  }

  void IndexFileSummaries(const std::vector<CodeBlock>&) override {
    std::lock_guard lock(mutex_);
    calls_.push_back("summaries");
  }

  void Persist() override {
    std::lock_guard lock(mutex_);
    calls_.push_back("persist");
  }

  std::vector<std::string> Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  std::vector<CodeBlock> LastBlocks() const {
    std::lock_guard lock(mutex_);
    return last_blocks_;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    calls_.clear();
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> calls_;
  std::vector<CodeBlock>   last_blocks_;
};

class FailingVectorIndex : public VectorIndex {
 public:
  void IndexCodeBlocks(const std::vector<CodeBlock>&) override {
    throw std::runtime_error("embedding service unreachable");
  }
  void IndexFileSummaries(const std::vector<CodeBlock>&) override {
  }
  void Persist() override {
  }
};

void TestHashFiles() {
  const auto hashes = HashFiles(SampleBlocks());
  assert(hashes.size() == 2);
  assert(hashes.at("src/Svc.java").size() == 16);
  assert(hashes.at("src/Svc.java") != hashes.at("src/Repo.java"));
  assert(hashes == HashFiles(SampleBlocks()));

  // block boundaries are part of the content
  const auto joined = HashFiles({MakeBlock("a", "a", {}, "F.java", "ab")});
  const auto split  = HashFiles({MakeBlock("a", "a", {}, "F.java", "a"), MakeBlock("b", "b", {}, "F.java", "b")});
  assert(joined.at("F.java") != split.at("F.java"));

  assert(HashFiles({MakeBlock("x", "x", {}, "", "code")}).count("(unknown)") == 1);
}

void TestReindexFeedsEveryStage(const std::string& path) {
  auto store  = std::make_shared<SqliteGraphStore>(path);
  auto vector = std::make_shared<RecordingVectorIndex>();

  IndexingService service(store, vector);
  const auto      overview = service.Reindex(std::string("shop"), SampleBlocks());

  assert(overview.rfind("Project: shop\nFiles indexed: 2\nMethods indexed: 3\nCall edges (best-effort): 2", 0) == 0);
  assert(overview.find("- void handle(Request r) (calls=2)") != std::string::npos);

  assert((vector->Calls() == std::vector<std::string>{"blocks", "summaries", "persist"}));
  for (const auto& block : vector->LastBlocks()) {
    assert(block.project() == "shop");
  }

  const auto job = store->GetIndexingJob(std::string("shop"));
  assert(job.has_value());
  assert(job->status == "done");
  assert(job->step == "done");
  assert(job->total_files == 2);
  assert(job->processed_files == 2);
  assert(job->finished_at_ms >= job->started_at_ms);
  assert(!job->error.has_value());

  const auto statuses = store->ListFileStatuses(std::string("shop"));
  assert(statuses.size() == 2);
  assert(statuses[0].file_path == "src/Repo.java");
  assert(statuses[0].status == "indexed");
  assert(statuses[0].file_hash == HashFiles(SampleBlocks()).at("src/Repo.java"));

  vector->Clear();
  service.Reindex(std::string("shop"), SampleBlocks(), false);
  assert((vector->Calls() == std::vector<std::string>{"blocks", "persist"}));

  assert(store->GetFileDependencies(std::string("shop")).at("src/Svc.java") == std::vector<std::string>{"src/Repo.java"});
}

void TestChangedFiles(const std::string& path) {
  auto            store = std::make_shared<SqliteGraphStore>(path);
  IndexingService service(store);

  auto blocks = SampleBlocks();
  assert(service.ChangedFiles(std::string("diff"), blocks).size() == 2);

  service.Reindex(std::string("diff"), blocks);
  assert(service.ChangedFiles(std::string("diff"), blocks).empty());

  blocks[2].set_code("void store(Request r) { rows.add(r); audit(r); }");
  blocks.push_back(MakeBlock("Audit.log", "void log()", {}, "src/Audit.java", "void log() {}"));
  assert((service.ChangedFiles(std::string("diff"), blocks) == std::vector<std::string>{"src/Audit.java", "src/Repo.java"}));
}

void TestEmptyInput(const std::string& path) {
  auto            store = std::make_shared<SqliteGraphStore>(path);
  IndexingService service(store);

  assert(service.Reindex(std::nullopt, {}) == "No code blocks found.");
  const auto job = store->GetIndexingJob(std::nullopt);
  assert(job.has_value());
  assert(job->status == "done");
  assert(job->total_files == 0);
}

void TestFailureIsRecordedAndRethrown(const std::string& path) {
  auto            store = std::make_shared<SqliteGraphStore>(path);
  IndexingService service(store, std::make_shared<FailingVectorIndex>());

  bool threw = false;
  try {
    service.Reindex(std::string("broken"), SampleBlocks());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "embedding service unreachable";
  }
  assert(threw);

  const auto job = store->GetIndexingJob(std::string("broken"));
  assert(job.has_value());
  assert(job->status == "failed");
  assert(job->step == "vector_index");
  assert(job->error == std::optional<std::string>("embedding service unreachable"));
  assert(job->processed_files == 0);

  // the graph was never touched
  assert(store->OverviewText(std::string("broken")).find("Methods indexed: 0") != std::string::npos);
  assert(store->ListFileStatuses(std::string("broken")).empty());
}

void TestConcurrentProjects(const std::string& path) {
  codeintel::runtime::config::RuntimeConfig config;
  config.mutable_storage()->set_graph_db_path(path);
  config.mutable_storage()->set_checkpoint_db_path(path + ".checkpoints");

  const auto first  = codeintel::factory::Build(config);
  const auto second = codeintel::factory::Build(config);

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    const auto& runtime = i % 2 == 0 ? first : second;
    threads.emplace_back([&runtime, i] {
      for (int round = 0; round < 3; ++round) {
        runtime.indexing->Reindex("tenant-" + std::to_string(i), SampleBlocks());
      }
    });
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < 4; ++i) {
    const auto project = "tenant-" + std::to_string(i);
    assert(first.graph_store->OverviewText(project).find("Methods indexed: 3\nCall edges (best-effort): 2") != std::string::npos);
    assert(first.graph_store->GetIndexingJob(project)->status == "done");
    // node ids carry the project, so neighbors stay inside it
    const auto neighbors = first.graph_store->NeighborsText(project, project + "::Svc.handle");
    assert(neighbors.rfind("Node: void handle(Request r)\nDepth: 1\n\nCalls:", 0) == 0);
  }
}

void TestNullStoreIsRejected() {
  bool threw = false;
  try {
    IndexingService service(nullptr);
  } catch (const codeintel::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TempDir    dir("codeintel_integration_indexing");
  const auto path = (dir / "graph.sqlite3").string();

  TestHashFiles();
  TestReindexFeedsEveryStage(path);
  TestChangedFiles(path);
  TestEmptyInput(path);
  TestFailureIsRecordedAndRethrown(path);
  TestConcurrentProjects(path);
  TestNullStoreIsRejected();

  std::cout << "codeintel_integration_indexing_service: pass\n";
  return 0;
}
