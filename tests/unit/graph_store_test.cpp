#include "internal/graph/sqlite_graph_store.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "tests/support/test_fakes.hpp"

namespace {

using codeintel::graph::FileStatusRecord;
using codeintel::graph::IndexingJobRecord;
using codeintel::graph::SqliteGraphStore;
using codeintel::testing::TempDir;
using codeintel::v1::CodeBlock;

CodeBlock MakeBlock(const std::string& id, const std::string& signature, const std::vector<std::string>& calls, const std::string& file_path) {
  CodeBlock block;
  block.set_id(id);
  block.set_signature(signature);
  for (const auto& call : calls) block.add_calls(call);
  block.set_file_path(file_path);
  return block;
}

std::vector<CodeBlock> SampleBlocks() {
  return {
      MakeBlock("A.foo", "void foo()", {"bar", "baz"}, "A.java"),
      MakeBlock("B.bar", "void bar()", {"baz"}, "B.java"),
      MakeBlock("B.baz", "void baz()", {}, "B.java"),
  };
}

const std::string kEmptyDefaultOverview =
    "Project: (default)\n"
    "Files indexed: 0\n"
    "Methods indexed: 0\n"
    "Call edges (best-effort): 0";

void TestRebuildAndOverview(SqliteGraphStore& store) {
  const auto stats = store.Rebuild(std::string("p"), SampleBlocks());
  assert(stats.files == 2);
  assert(stats.methods == 3);
  assert(stats.call_edges == 3);
  assert(stats.contains_edges == 3);

  const std::string expected =
      "Project: p\n"
      "Files indexed: 2\n"
      "Methods indexed: 3\n"
      "Call edges (best-effort): 3\n"
      "\n"
      "Top callers (out-degree):\n"
      "- void foo() (calls=2)\n"
      "- void bar() (calls=1)\n"
      "\n"
      "Top callees (in-degree):\n"
      "- void baz() (called_by=2)\n"
      "- void bar() (called_by=1)\n"
      "\n"
      "Sample call edges:\n"
      "- void foo() -> void bar()\n"
      "- void foo() -> void baz()\n"
      "- void bar() -> void baz()";
  assert(store.OverviewText(std::string("p")) == expected);

  // limit bounds every section; non-positive limits behave as 1
  const auto limited = store.OverviewText(std::string("p"), 0);
  assert(limited.find("- void foo() (calls=2)") != std::string::npos);
  assert(limited.find("- void bar() (calls=1)") == std::string::npos);
  assert(limited.find("- void foo() -> void baz()") == std::string::npos);
}

void TestScopesAreIsolated(SqliteGraphStore& store) {
  store.Rebuild(std::string("q"), {MakeBlock("Q.only", "void only()", {}, "Q.java")});

  assert(store.OverviewText(std::string("p")).find("Methods indexed: 3") != std::string::npos);
  assert(store.OverviewText(std::string("q")).find("Methods indexed: 1") != std::string::npos);
  assert(store.OverviewText(std::nullopt) == kEmptyDefaultOverview);
  assert(store.OverviewText(std::string("never-built")).find("Files indexed: 0") != std::string::npos);

  // unscoped rebuild keeps unprefixed ids and leaves named projects alone
  store.Rebuild(std::nullopt, SampleBlocks());
  assert(store.OverviewText(std::nullopt).find("Project: (default)\nFiles indexed: 2") == 0);
  assert(store.NeighborsText(std::nullopt, "B.bar").find("Node: void bar()") == 0);
  assert(store.OverviewText(std::string("q")).find("Methods indexed: 1") != std::string::npos);

  // "" addresses the unscoped project too
  assert(store.OverviewText(std::string("")) == store.OverviewText(std::nullopt));
}

void TestRebuildReplacesPreviousGraph(SqliteGraphStore& store) {
  store.Rebuild(std::string("r"), SampleBlocks());
  const auto stats = store.Rebuild(std::string("r"), {MakeBlock("A.foo", "void foo()", {"bar"}, "A.java")});
  assert(stats.methods == 1);
  assert(stats.call_edges == 0);

  const auto text = store.OverviewText(std::string("r"));
  assert(text == "Project: r\nFiles indexed: 1\nMethods indexed: 1\nCall edges (best-effort): 0");

  store.Rebuild(std::string("r"), {});
  assert(store.OverviewText(std::string("r")).find("Methods indexed: 0") != std::string::npos);
}

void TestNeighbors(SqliteGraphStore& store) {
  const auto one_hop = store.NeighborsText(std::string("p"), "p::B.bar");
  assert(one_hop ==
         "Node: void bar()\n"
         "Depth: 1\n"
         "\n"
         "Calls:\n"
         "- void bar() -> void baz()\n"
         "\n"
         "Called by:\n"
         "- void foo() -> void bar()");

  const auto two_hops = store.NeighborsText(std::string("p"), "p::A.foo", 2);
  assert(two_hops.find("Depth: 2") != std::string::npos);
  assert(codeintel::testing::CountOccurrences(two_hops, " -> ") == 6);

  // depth and limit are clamped
  assert(store.NeighborsText(std::string("p"), "p::A.foo", 10).find("Depth: 4") != std::string::npos);
  assert(store.NeighborsText(std::string("p"), "p::A.foo", 0).find("Depth: 1") != std::string::npos);

  const auto limited = store.NeighborsText(std::string("p"), "p::A.foo", 1, 1);
  assert(codeintel::testing::CountOccurrences(limited, " -> ") == 1);
  assert(limited.find("- void foo() -> void bar()") != std::string::npos);

  assert(store.NeighborsText(std::string("p"), "missing") == "Node: missing\nDepth: 1");
  // node ids are per scope
  assert(store.NeighborsText(std::string("q"), "p::B.bar") == "Node: p::B.bar\nDepth: 1");
}

void TestFileDependencies(SqliteGraphStore& store) {
  const auto deps = store.GetFileDependencies(std::string("p"));
  assert(deps.size() == 1);
  assert(deps.at("A.java") == std::vector<std::string>{"B.java"});

  assert(store.GetFileDependencies(std::string("q")).empty());
}

void TestFileStatusBookkeeping(SqliteGraphStore& store) {
  assert(!store.GetFileStatus(std::string("p"), "A.java").has_value());

  store.UpdateFileStatus(std::string("p"), FileStatusRecord{"B.java", "h1", "indexed", 100});
  store.UpdateFileStatus(std::string("p"), FileStatusRecord{"A.java", "h2", "indexed", 100});
  store.UpdateFileStatus(std::string("p"), FileStatusRecord{"A.java", "h3", "stale", 200});
  store.UpdateFileStatus(std::nullopt, FileStatusRecord{"A.java", "unscoped", "indexed", 50});

  const auto a = store.GetFileStatus(std::string("p"), "A.java");
  assert(a.has_value());
  assert(a->file_hash == "h3");
  assert(a->status == "stale");
  assert(a->updated_at_ms == 200);

  const auto listed = store.ListFileStatuses(std::string("p"));
  assert(listed.size() == 2);
  assert(listed[0].file_path == "A.java");
  assert(listed[1].file_path == "B.java");

  assert(store.GetFileStatus(std::nullopt, "A.java")->file_hash == "unscoped");
  assert(store.ListFileStatuses(std::nullopt).size() == 1);
}

void TestIndexingJobBookkeeping(SqliteGraphStore& store) {
  assert(!store.GetIndexingJob(std::string("p")).has_value());

  IndexingJobRecord job;
  job.status        = "in_progress";
  job.started_at_ms = 10;
  job.total_files   = 4;
  job.step          = "graph";
  store.UpdateIndexingJob(std::string("p"), job);

  job.status          = "failed";
  job.finished_at_ms  = 20;
  job.processed_files = 2;
  job.error           = "boom";
  store.UpdateIndexingJob(std::string("p"), job);

  const auto stored = store.GetIndexingJob(std::string("p"));
  assert(stored.has_value());
  assert(stored->status == "failed");
  assert(stored->started_at_ms == 10);
  assert(stored->finished_at_ms == 20);
  assert(stored->error == std::optional<std::string>("boom"));
  assert(stored->total_files == 4);
  assert(stored->processed_files == 2);
  assert(stored->step == "graph");

  assert(!store.GetIndexingJob(std::nullopt).has_value());
}

void TestReopenSeesPersistedGraph(const std::string& path) {
  SqliteGraphStore reopened(path);
  assert(reopened.OverviewText(std::string("p")).find("Call edges (best-effort): 3") != std::string::npos);
}

void TestConcurrentRebuildsOfDifferentProjects(const std::string& path) {
  SqliteGraphStore first(path);
  SqliteGraphStore second(path);

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    auto& store = i % 2 == 0 ? first : second;
    threads.emplace_back([&store, i] {
      const auto project = "concurrent-" + std::to_string(i);
      for (int round = 0; round < 3; ++round) {
        store.Rebuild(project, SampleBlocks());
      }
    });
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < 4; ++i) {
    const auto text = first.OverviewText("concurrent-" + std::to_string(i));
    assert(text.find("Methods indexed: 3\nCall edges (best-effort): 3") != std::string::npos);
  }
}

} // namespace

int main() {
  TempDir    dir("codeintel_unit_graph_store");
  const auto path = (dir / "nested/graph.sqlite3").string();

  {
    SqliteGraphStore store(path);
    assert(store.OverviewText(std::nullopt) == kEmptyDefaultOverview);

    TestRebuildAndOverview(store);
    TestScopesAreIsolated(store);
    TestRebuildReplacesPreviousGraph(store);
    TestNeighbors(store);
    TestFileDependencies(store);
    TestFileStatusBookkeeping(store);
    TestIndexingJobBookkeeping(store);
  }
  TestReopenSeesPersistedGraph(path);
  TestConcurrentRebuildsOfDifferentProjects(path);

  std::cout << "codeintel_unit_graph_store: pass\n";
  return 0;
}
