#include "internal/graph/sqlite_graph_store.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/graph_sql.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/graph/call_graph_builder.hpp"
#include "internal/observability/logging.hpp"

namespace codeintel::graph {

namespace sql = db::sql;

using db::ThrowIfDbError;
using db::sql::ScopedSql;
using db::sqlite::SqliteDB;
using db::sqlite::SqliteStmt;
using db::sqlite::SqliteTransaction;
using observability::CountField;
using observability::StringField;

namespace {

/*
  Prepares the scoped or unscoped variant of a query and binds the
  project. Bind() re-applies the project after a Reset(); the returned
  index is the first free parameter.
*/
class ScopedStmt {
 public:
  ScopedStmt(sqlite3* db, const ScopedSql& sql, const ProjectScope& scope)
      : stmt_(db, scope ? sql.scoped : sql.unscoped), scope_(scope) {
    Bind();
  }

  int Bind() {
    if (!scope_) return 1;
    stmt_.BindText(1, *scope_);
    return 2;
  }

  SqliteStmt& operator*() {
    return stmt_;
  }

  SqliteStmt* operator->() {
    return &stmt_;
  }

 private:
  SqliteStmt   stmt_;
  ProjectScope scope_;
};

uint64_t CountOf(sqlite3* db, const ScopedSql& sql, const ProjectScope& scope) {
  ScopedStmt q(db, sql, scope);
  return q->Next() ? q->ColU64(0) : 0;
}

// node id -> label, falling back to the id itself
class LabelResolver {
 public:
  LabelResolver(sqlite3* db, const ProjectScope& scope) : query_(db, sql::NODE_LABEL, scope) {
  }

  const std::string& operator()(const std::string& node_id) {
    if (auto it = cache_.find(node_id); it != cache_.end()) return it->second;

    query_->Reset();
    query_->BindText(query_.Bind(), node_id);

    std::string label;
    if (query_->Next()) label = query_->ColText(0);
    if (label.empty()) label = node_id;
    return cache_.emplace(node_id, std::move(label)).first->second;
  }

 private:
  ScopedStmt                                   query_;
  std::unordered_map<std::string, std::string> cache_;
};

std::vector<std::pair<std::string, uint64_t>> RankedNodes(sqlite3* db, const ScopedSql& sql, const ProjectScope& scope, int limit) {
  ScopedStmt q(db, sql, scope);
  q->BindInt64(q.Bind(), limit);

  std::vector<std::pair<std::string, uint64_t>> out;
  while (q->Next()) {
    out.emplace_back(q->ColText(0), q->ColU64(1));
  }
  return out;
}

std::vector<std::string> Adjacent(ScopedStmt& q, const std::string& node_id, int limit) {
  q->Reset();
  const int idx = q.Bind();
  q->BindText(idx, node_id);
  q->BindInt64(idx + 1, limit);

  std::vector<std::string> out;
  while (q->Next()) {
    out.push_back(q->ColText(0));
  }
  return out;
}

FileStatusRecord ReadFileStatus(SqliteStmt& st) {
  FileStatusRecord r;
  r.file_path     = st.ColText(0);
  r.file_hash     = st.ColText(1);
  r.status        = st.ColText(2);
  r.updated_at_ms = st.ColU64(3);
  return r;
}

} // namespace

SqliteGraphStore::SqliteGraphStore(std::string sqlite_path) : path_(std::move(sqlite_path)) {
  db::sqlite::EnsureParentDirectory(path_);

  auto db = Connect();
  sql::RunMigrations(*db, "graph", sql::GRAPH_SCHEMA);
}

std::shared_ptr<SqliteDB> SqliteGraphStore::Connect() const {
  return std::make_shared<SqliteDB>(path_);
}

// ------------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------------

GraphStats SqliteGraphStore::Rebuild(const ProjectScope& scope, const std::vector<v1::CodeBlock>& blocks) {
  const auto project = NormalizeScope(scope);
  const auto key     = ScopeKey(project);
  auto       graph   = BuildCallGraph(project, blocks);

  std::lock_guard lock(write_mutex_);
  auto            db = Connect();
  auto*           h  = db->Handle();

  SqliteTransaction tx(db);
  {
    ScopedStmt delete_edges(h, sql::DELETE_EDGES, project);
    ThrowIfDbError(delete_edges->Run(), "delete edges");
    ScopedStmt delete_nodes(h, sql::DELETE_NODES, project);
    ThrowIfDbError(delete_nodes->Run(), "delete nodes");

    SqliteStmt insert_node(h, sql::INSERT_NODE);
    for (const auto& node : graph.nodes) {
      insert_node.BindText(1, key);
      insert_node.BindText(2, node.node_id);
      insert_node.BindText(3, ToString(node.kind));
      insert_node.BindText(4, node.label);
      insert_node.BindOptionalText(5, node.file_path);
      insert_node.BindOptionalText(6, node.signature);
      ThrowIfDbError(insert_node.Run(), "insert node " + node.node_id);
      insert_node.Reset();
    }

    SqliteStmt insert_edge(h, sql::INSERT_EDGE);
    for (const auto* edges : {&graph.contains_edges, &graph.call_edges}) {
      for (const auto& edge : *edges) {
        insert_edge.BindText(1, key);
        insert_edge.BindText(2, edge.src);
        insert_edge.BindText(3, edge.dst);
        insert_edge.BindText(4, ToString(edge.type));
        ThrowIfDbError(insert_edge.Run(), "insert edge " + edge.src + " -> " + edge.dst);
        insert_edge.Reset();
      }
    }
  }
  tx.Commit();

  CODEINTEL_LOG_INFO("graph rebuilt",
                     {StringField("project", project.value_or("(default)")),
                      CountField("files", graph.stats.files),
                      CountField("methods", graph.stats.methods),
                      CountField("call_edges", graph.stats.call_edges)});
  return graph.stats;
}

// ------------------------------------------------------------------
// Reports
// ------------------------------------------------------------------

std::string SqliteGraphStore::OverviewText(const ProjectScope& scope, int limit) const {
  const auto project = NormalizeScope(scope);
  const int  lim     = std::max(1, limit);

  auto  db = Connect();
  auto* h  = db->Handle();

  const auto files      = CountOf(h, sql::COUNT_NODES_OF_KIND_FILE, project);
  const auto methods    = CountOf(h, sql::COUNT_NODES_OF_KIND_METHOD, project);
  const auto call_edges = CountOf(h, sql::COUNT_CALL_EDGES, project);

  const auto callers = RankedNodes(h, sql::TOP_CALLERS, project, lim);
  const auto callees = RankedNodes(h, sql::TOP_CALLEES, project, lim);

  std::vector<std::pair<std::string, std::string>> samples;
  {
    ScopedStmt q(h, sql::SAMPLE_CALL_EDGES, project);
    q->BindInt64(q.Bind(), lim);
    while (q->Next()) {
      samples.emplace_back(q->ColText(0), q->ColText(1));
    }
  }

  LabelResolver label(h, project);

  std::ostringstream out;
  out << "Project: " << project.value_or("(default)") << '\n';
  out << "Files indexed: " << files << '\n';
  out << "Methods indexed: " << methods << '\n';
  out << "Call edges (best-effort): " << call_edges;

  if (!callers.empty()) {
    out << "\n\nTop callers (out-degree):";
    for (const auto& [node_id, count] : callers) {
      out << "\n- " << label(node_id) << " (calls=" << count << ")";
    }
  }

  if (!callees.empty()) {
    out << "\n\nTop callees (in-degree):";
    for (const auto& [node_id, count] : callees) {
      out << "\n- " << label(node_id) << " (called_by=" << count << ")";
    }
  }

  if (!samples.empty()) {
    out << "\n\nSample call edges:";
    for (const auto& [src, dst] : samples) {
      out << "\n- " << label(src) << " -> " << label(dst);
    }
  }

  return out.str();
}

std::string SqliteGraphStore::NeighborsText(const ProjectScope& scope, const std::string& node_id, int depth, int limit) const {
  const auto project = NormalizeScope(scope);
  const int  d       = std::clamp(depth, 1, 4);
  const int  lim     = std::clamp(limit, 1, 200);

  auto  db = Connect();
  auto* h  = db->Handle();

  ScopedStmt callees_of(h, sql::CALLEES_OF, project);
  ScopedStmt callers_of(h, sql::CALLERS_OF, project);

  std::set<std::string>                            frontier{node_id};
  std::set<std::string>                            visited{node_id};
  std::vector<std::pair<std::string, std::string>> edges_out;
  std::vector<std::pair<std::string, std::string>> edges_in;

  for (int level = 0; level < d && !frontier.empty(); ++level) {
    std::set<std::string> next;
    int                   expanded = 0;
    for (const auto& n : frontier) {
      if (expanded++ >= lim) break;

      for (auto& dst : Adjacent(callees_of, n, lim)) {
        edges_out.emplace_back(n, dst);
        if (visited.insert(dst).second) next.insert(dst);
      }
      for (auto& src : Adjacent(callers_of, n, lim)) {
        edges_in.emplace_back(src, n);
        if (visited.insert(src).second) next.insert(src);
      }
    }
    frontier = std::move(next);
  }

  LabelResolver label(h, project);

  std::ostringstream out;
  out << "Node: " << label(node_id) << '\n';
  out << "Depth: " << d;

  const auto section = [&](const char* title, const std::vector<std::pair<std::string, std::string>>& edges) {
    if (edges.empty()) return;
    out << "\n\n" << title;
    const auto n = std::min(edges.size(), static_cast<std::size_t>(lim));
    for (std::size_t i = 0; i < n; ++i) {
      out << "\n- " << label(edges[i].first) << " -> " << label(edges[i].second);
    }
  };
  section("Calls:", edges_out);
  section("Called by:", edges_in);

  return out.str();
}

FileDependencies SqliteGraphStore::GetFileDependencies(const ProjectScope& scope) const {
  const auto project = NormalizeScope(scope);
  auto       db      = Connect();

  FileDependencies deps;
  ScopedStmt       q(db->Handle(), sql::FILE_DEPENDENCIES, project);
  while (q->Next()) {
    deps[q->ColText(0)].push_back(q->ColText(1));
  }
  return deps;
}

// ------------------------------------------------------------------
// File status / indexing jobs
// ------------------------------------------------------------------

std::optional<FileStatusRecord> SqliteGraphStore::GetFileStatus(const ProjectScope& scope, const std::string& file_path) const {
  const auto project = NormalizeScope(scope);
  auto       db      = Connect();

  ScopedStmt q(db->Handle(), sql::SELECT_FILE_STATUS, project);
  q->BindText(q.Bind(), file_path);
  if (!q->Next()) return std::nullopt;
  return ReadFileStatus(*q);
}

void SqliteGraphStore::UpdateFileStatus(const ProjectScope& scope, const FileStatusRecord& record) {
  std::lock_guard lock(write_mutex_);
  auto            db = Connect();

  SqliteStmt st(db->Handle(), sql::UPSERT_FILE_STATUS);
  st.BindText(1, ScopeKey(NormalizeScope(scope)));
  st.BindText(2, record.file_path);
  st.BindText(3, record.file_hash);
  st.BindText(4, record.status);
  st.BindU64(5, record.updated_at_ms);
  ThrowIfDbError(st.Run(), "upsert file status " + record.file_path);
}

std::vector<FileStatusRecord> SqliteGraphStore::ListFileStatuses(const ProjectScope& scope) const {
  const auto project = NormalizeScope(scope);
  auto       db      = Connect();

  std::vector<FileStatusRecord> out;
  ScopedStmt                    q(db->Handle(), sql::LIST_FILE_STATUS, project);
  while (q->Next()) {
    out.push_back(ReadFileStatus(*q));
  }
  return out;
}

std::optional<IndexingJobRecord> SqliteGraphStore::GetIndexingJob(const ProjectScope& scope) const {
  const auto project = NormalizeScope(scope);
  auto       db      = Connect();

  ScopedStmt q(db->Handle(), sql::SELECT_INDEXING_JOB, project);
  if (!q->Next()) return std::nullopt;

  IndexingJobRecord r;
  r.status          = q->ColText(0);
  r.started_at_ms   = q->ColU64(1);
  r.finished_at_ms  = q->ColU64(2);
  r.error           = q->ColOptionalText(3);
  r.total_files     = q->ColU64(4);
  r.processed_files = q->ColU64(5);
  r.step            = q->ColText(6);
  return r;
}

void SqliteGraphStore::UpdateIndexingJob(const ProjectScope& scope, const IndexingJobRecord& record) {
  std::lock_guard lock(write_mutex_);
  auto            db = Connect();

  SqliteStmt st(db->Handle(), sql::UPSERT_INDEXING_JOB);
  st.BindText(1, ScopeKey(NormalizeScope(scope)));
  st.BindText(2, record.status);
  st.BindU64(3, record.started_at_ms);
  st.BindU64(4, record.finished_at_ms);
  st.BindOptionalText(5, record.error);
  st.BindU64(6, record.total_files);
  st.BindU64(7, record.processed_files);
  st.BindText(8, record.step);
  ThrowIfDbError(st.Run(), "upsert indexing job");
}

} // namespace codeintel::graph
