#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codeintel::graph {

/*
  Project call-graph model.

  A scope is an optional project name. nullopt (or "") is the unscoped
  project, persisted as the empty-string sentinel.
*/

using ProjectScope = std::optional<std::string>;

enum class NodeKind { Method, File };

enum class EdgeType { Contains, Calls };

inline const char* ToString(NodeKind kind) {
  return kind == NodeKind::File ? "file" : "method";
}

inline const char* ToString(EdgeType type) {
  return type == EdgeType::Calls ? "calls" : "contains";
}

struct GraphNode {
  std::string                node_id;
  NodeKind                   kind = NodeKind::Method;
  std::string                label;
  std::optional<std::string> file_path;
  std::optional<std::string> signature;
};

struct GraphEdge {
  std::string src;
  std::string dst;
  EdgeType    type = EdgeType::Calls;

  bool operator==(const GraphEdge&) const = default;
};

struct GraphStats {
  ProjectScope project;
  std::size_t  files          = 0;
  std::size_t  methods        = 0;
  std::size_t  call_edges     = 0;
  std::size_t  contains_edges = 0;
};

struct FileStatusRecord {
  std::string file_path;
  std::string file_hash;
  std::string status;
  uint64_t    updated_at_ms = 0;
};

struct IndexingJobRecord {
  std::string                status;
  uint64_t                   started_at_ms   = 0;
  uint64_t                   finished_at_ms  = 0;
  std::optional<std::string> error;
  uint64_t                   total_files     = 0;
  uint64_t                   processed_files = 0;
  std::string                step;
};

// source file -> files it calls into, both sorted
using FileDependencies = std::map<std::string, std::vector<std::string>>;

// Attribution file for records that carry no path.
inline constexpr const char* kUnknownFile = "(unknown)";

inline ProjectScope NormalizeScope(const ProjectScope& scope) {
  if (scope && !scope->empty()) return scope;
  return std::nullopt;
}

// Value stored in the `project` column.
inline std::string ScopeKey(const ProjectScope& scope) {
  return scope ? *scope : std::string();
}

inline std::string MethodNodeId(const ProjectScope& scope, const std::string& method_id) {
  const auto s = NormalizeScope(scope);
  return s ? *s + "::" + method_id : method_id;
}

inline std::string FileNodeId(const ProjectScope& scope, const std::string& file_path) {
  const auto s = NormalizeScope(scope);
  return s ? *s + "::file::" + file_path : "file::" + file_path;
}

} // namespace codeintel::graph
