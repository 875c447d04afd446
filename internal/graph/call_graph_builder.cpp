#include "internal/graph/call_graph_builder.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace codeintel::graph {

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

struct CallerEntry {
  std::string              node_id;
  std::vector<std::string> call_names; // trimmed, lowercased, non-empty
};

} // namespace

CallGraph BuildCallGraph(const ProjectScope& scope, const std::vector<v1::CodeBlock>& blocks) {
  CallGraph graph;
  graph.stats.project = NormalizeScope(scope);

  std::vector<GraphNode>                  files;
  std::set<std::string>                   seen_files;
  std::vector<GraphNode>                  methods;
  std::unordered_map<std::string, size_t> method_pos;
  std::set<std::pair<std::string, std::string>> seen_contains;

  for (const auto& block : blocks) {
    const std::string file_path = block.file_path().empty() ? kUnknownFile : block.file_path();
    const std::string file_id   = FileNodeId(scope, file_path);
    const std::string method_id = MethodNodeId(scope, block.id());

    if (seen_files.insert(file_id).second) {
      GraphNode file;
      file.node_id   = file_id;
      file.kind      = NodeKind::File;
      file.label     = file_path;
      file.file_path = file_path;
      files.push_back(std::move(file));
    }

    GraphNode method;
    method.node_id   = method_id;
    method.kind      = NodeKind::Method;
    method.label     = block.signature().empty() ? block.id() : block.signature();
    method.file_path = file_path;
    method.signature = block.signature();

    // a repeated record id replaces the earlier node in place
    if (auto it = method_pos.find(method_id); it != method_pos.end()) {
      methods[it->second] = std::move(method);
    } else {
      method_pos.emplace(method_id, methods.size());
      methods.push_back(std::move(method));
    }

    if (seen_contains.emplace(file_id, method_id).second) {
      graph.contains_edges.push_back({file_id, method_id, EdgeType::Contains});
    }
  }

  // every record participates as a caller, later records override callee signatures
  std::vector<CallerEntry> callers;
  callers.reserve(blocks.size());
  for (const auto& block : blocks) {
    CallerEntry entry;
    entry.node_id = MethodNodeId(scope, block.id());
    for (const auto& call : block.calls()) {
      auto name = Lower(Trim(call));
      if (!name.empty()) entry.call_names.push_back(std::move(name));
    }
    callers.push_back(std::move(entry));
  }

  std::vector<std::pair<std::string, std::string>> callees; // node_id, signature_lower
  callees.reserve(methods.size());
  for (const auto& m : methods) {
    callees.emplace_back(m.node_id, Lower(m.signature.value_or("")));
  }

  std::set<std::pair<std::string, std::string>> seen_calls;
  for (const auto& caller : callers) {
    for (const auto& name : caller.call_names) {
      for (const auto& [dst, signature_lower] : callees) {
        if (dst == caller.node_id) continue;
        if (signature_lower.find(name) == std::string::npos) continue;
        if (seen_calls.emplace(caller.node_id, dst).second) {
          graph.call_edges.push_back({caller.node_id, dst, EdgeType::Calls});
        }
      }
    }
  }

  graph.stats.files          = files.size();
  graph.stats.methods        = methods.size();
  graph.stats.call_edges     = graph.call_edges.size();
  graph.stats.contains_edges = graph.contains_edges.size();

  graph.nodes = std::move(files);
  graph.nodes.insert(graph.nodes.end(), std::make_move_iterator(methods.begin()), std::make_move_iterator(methods.end()));
  return graph;
}

} // namespace codeintel::graph
