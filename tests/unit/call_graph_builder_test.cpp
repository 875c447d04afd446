#include "internal/graph/call_graph_builder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using codeintel::graph::BuildCallGraph;
using codeintel::graph::EdgeType;
using codeintel::graph::GraphEdge;
using codeintel::graph::NodeKind;
using codeintel::v1::CodeBlock;

CodeBlock MakeBlock(const std::string& id, const std::string& signature, const std::vector<std::string>& calls, const std::string& file_path) {
  CodeBlock block;
  block.set_id(id);
  block.set_signature(signature);
  for (const auto& call : calls) block.add_calls(call);
  block.set_file_path(file_path);
  block.set_type("method");
  return block;
}

bool HasEdge(const std::vector<GraphEdge>& edges, const std::string& src, const std::string& dst) {
  return std::any_of(edges.begin(), edges.end(), [&](const GraphEdge& e) { return e.src == src && e.dst == dst; });
}

void TestScopedNodeIdsAndUnknownFile() {
  const std::vector<CodeBlock> blocks = {
      MakeBlock("A.foo", "void foo()", {"bar"}, "src/A.java"),
      MakeBlock("A.bar", "int bar(int x)", {}, "src/A.java"),
      MakeBlock("Orphan.baz", "void baz()", {"  BAR "}, ""),
  };

  const auto graph = BuildCallGraph(std::string("proj"), blocks);

  assert(graph.stats.project == std::optional<std::string>("proj"));
  assert(graph.stats.files == 2);
  assert(graph.stats.methods == 3);
  assert(graph.stats.contains_edges == 3);
  assert(graph.stats.call_edges == 2);

  assert(graph.nodes.size() == 5);
  assert(graph.nodes[0].kind == NodeKind::File);
  assert(graph.nodes[0].node_id == "proj::file::src/A.java");
  assert(graph.nodes[0].label == "src/A.java");
  assert(graph.nodes[1].node_id == "proj::file::(unknown)");
  assert(graph.nodes[2].kind == NodeKind::Method);
  assert(graph.nodes[2].node_id == "proj::A.foo");
  assert(graph.nodes[2].label == "void foo()");
  assert(graph.nodes[4].file_path == std::optional<std::string>("(unknown)"));

  assert(HasEdge(graph.contains_edges, "proj::file::src/A.java", "proj::A.foo"));
  assert(HasEdge(graph.contains_edges, "proj::file::(unknown)", "proj::Orphan.baz"));
  for (const auto& edge : graph.contains_edges) assert(edge.type == EdgeType::Contains);

  // call names are trimmed and matched case-insensitively
  assert(HasEdge(graph.call_edges, "proj::A.foo", "proj::A.bar"));
  assert(HasEdge(graph.call_edges, "proj::Orphan.baz", "proj::A.bar"));
}

void TestUnscopedIdsCarryNoPrefix() {
  const auto graph = BuildCallGraph(std::nullopt, {MakeBlock("X.run", "void run()", {}, "X.java")});
  assert(!graph.stats.project.has_value());
  assert(graph.nodes[0].node_id == "file::X.java");
  assert(graph.nodes[1].node_id == "X.run");

  // an empty project name is the unscoped project
  const auto empty_scope = BuildCallGraph(std::string(), {MakeBlock("X.run", "void run()", {}, "X.java")});
  assert(empty_scope.nodes[1].node_id == "X.run");
}

void TestSelfCallsAreNotEdges() {
  const auto graph = BuildCallGraph(std::string("p"), {MakeBlock("R.recurse", "void recurse(int n)", {"recurse"}, "R.java")});
  assert(graph.call_edges.empty());
  assert(graph.stats.call_edges == 0);
}

void TestDuplicateMatchesCollapse() {
  const std::vector<CodeBlock> blocks = {
      MakeBlock("A.foo", "void foo()", {"bar", "bar", "BAR", "ba"}, "A.java"),
      MakeBlock("B.bar", "void bar()", {}, "B.java"),
  };
  const auto graph = BuildCallGraph(std::string("p"), blocks);
  assert(graph.call_edges.size() == 1);
  assert(graph.call_edges[0].src == "p::A.foo");
  assert(graph.call_edges[0].dst == "p::B.bar");
  assert(graph.call_edges[0].type == EdgeType::Calls);
}

void TestSubstringMatchingIsBestEffort() {
  const std::vector<CodeBlock> blocks = {
      MakeBlock("Svc.load", "void load()", {"get"}, "Svc.java"),
      MakeBlock("User.getName", "String getName()", {}, "User.java"),
      MakeBlock("User.getId", "long getId()", {}, "User.java"),
      MakeBlock("User.target", "void target()", {}, "User.java"),
  };
  const auto graph = BuildCallGraph(std::string("p"), blocks);

  // "get" is a substring of both getters and of "target"
  assert(graph.call_edges.size() == 3);
  assert(HasEdge(graph.call_edges, "p::Svc.load", "p::User.getName"));
  assert(HasEdge(graph.call_edges, "p::Svc.load", "p::User.getId"));
  assert(HasEdge(graph.call_edges, "p::Svc.load", "p::User.target"));
}

void TestBlankCallNamesAreIgnored() {
  const std::vector<CodeBlock> blocks = {
      MakeBlock("A.foo", "void foo()", {"", "   "}, "A.java"),
      MakeBlock("B.bar", "void bar()", {}, "B.java"),
  };
  const auto graph = BuildCallGraph(std::string("p"), blocks);
  assert(graph.call_edges.empty());
}

void TestRepeatedRecordIdKeepsOneNode() {
  const std::vector<CodeBlock> blocks = {
      MakeBlock("A.foo", "void foo()", {}, "A.java"),
      MakeBlock("A.foo", "void foo(int x)", {}, "A.java"),
  };
  const auto graph = BuildCallGraph(std::string("p"), blocks);
  assert(graph.stats.methods == 1);
  assert(graph.stats.contains_edges == 1);
  assert(graph.nodes.back().signature == std::optional<std::string>("void foo(int x)"));
}

void TestEmptyInputBuildsEmptyGraph() {
  const auto graph = BuildCallGraph(std::string("p"), {});
  assert(graph.nodes.empty());
  assert(graph.stats.files == 0);
  assert(graph.stats.methods == 0);
}

} // namespace

int main() {
  TestScopedNodeIdsAndUnknownFile();
  TestUnscopedIdsCarryNoPrefix();
  TestSelfCallsAreNotEdges();
  TestDuplicateMatchesCollapse();
  TestSubstringMatchingIsBestEffort();
  TestBlankCallNamesAreIgnored();
  TestRepeatedRecordIdKeepsOneNode();
  TestEmptyInputBuildsEmptyGraph();

  std::cout << "codeintel_unit_call_graph_builder: pass\n";
  return 0;
}
