#pragma once

#include <vector>

#include "codeintel/v1.hpp"
#include "internal/graph/graph_model.hpp"

namespace codeintel::graph {

/*
  In-memory result of one rebuild pass. Node and edge lists are unique;
  `stats` counts exactly what they hold.
*/
struct CallGraph {
  std::vector<GraphNode> nodes; // files first, then methods
  std::vector<GraphEdge> contains_edges;
  std::vector<GraphEdge> call_edges;
  GraphStats             stats;
};

/*
  Builds file/method nodes and contains/calls edges from parsed records.

  A calls edge m -> n is emitted when one of m's call names (trimmed,
  lowercased) is a substring of n's lowercased signature and m != n.
  Best-effort name matching; overloads and same-named methods in
  unrelated classes all match.

  Pure: no I/O, no shared state.
*/
CallGraph BuildCallGraph(const ProjectScope& scope, const std::vector<v1::CodeBlock>& blocks);

} // namespace codeintel::graph
