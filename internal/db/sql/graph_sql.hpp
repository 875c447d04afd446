#pragma once

namespace codeintel::db::sql {

/*
  Project graph SQL (SQLite dialect).

  The unscoped project is stored as '' (never NULL) so the composite
  primary keys stay unique. Every query filtering on a project comes in
  two variants: `scoped` binds the project as parameter 1, `unscoped`
  matches the '' sentinel and its remaining parameters start at 1.
*/

struct ScopedSql {
  const char* scoped;
  const char* unscoped;
};

static constexpr const char* GRAPH_SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS nodes ("
    " project TEXT NOT NULL DEFAULT '',"
    " node_id TEXT NOT NULL,"
    " kind TEXT NOT NULL,"
    " label TEXT NOT NULL,"
    " file_path TEXT NULL,"
    " signature TEXT NULL,"
    " PRIMARY KEY(project, node_id));",

    "CREATE TABLE IF NOT EXISTS edges ("
    " project TEXT NOT NULL DEFAULT '',"
    " src TEXT NOT NULL,"
    " dst TEXT NOT NULL,"
    " type TEXT NOT NULL,"
    " PRIMARY KEY(project, src, dst, type));",

    "CREATE INDEX IF NOT EXISTS idx_edges_src ON edges(project, src);",
    "CREATE INDEX IF NOT EXISTS idx_edges_dst ON edges(project, dst);",

    "CREATE TABLE IF NOT EXISTS file_status ("
    " project TEXT NOT NULL DEFAULT '',"
    " file_path TEXT NOT NULL,"
    " file_hash TEXT NOT NULL,"
    " status TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY(project, file_path));",

    "CREATE TABLE IF NOT EXISTS indexing_jobs ("
    " project TEXT NOT NULL PRIMARY KEY,"
    " status TEXT NOT NULL,"
    " started_at_ms INTEGER NOT NULL DEFAULT 0,"
    " finished_at_ms INTEGER NOT NULL DEFAULT 0,"
    " error TEXT NULL,"
    " total_files INTEGER NOT NULL DEFAULT 0,"
    " processed_files INTEGER NOT NULL DEFAULT 0,"
    " step TEXT NOT NULL DEFAULT '');",
};

// rebuild

static constexpr ScopedSql DELETE_EDGES = {
    "DELETE FROM edges WHERE project = ?;",
    "DELETE FROM edges WHERE project = '';"};

static constexpr ScopedSql DELETE_NODES = {
    "DELETE FROM nodes WHERE project = ?;",
    "DELETE FROM nodes WHERE project = '';"};

static constexpr const char* INSERT_NODE =
    "INSERT OR REPLACE INTO nodes(project,node_id,kind,label,file_path,signature)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* INSERT_EDGE =
    "INSERT OR REPLACE INTO edges(project,src,dst,type) VALUES(?,?,?,?);";

// overview

static constexpr ScopedSql COUNT_NODES_OF_KIND_FILE = {
    "SELECT COUNT(*) FROM nodes WHERE project = ? AND kind = 'file';",
    "SELECT COUNT(*) FROM nodes WHERE project = '' AND kind = 'file';"};

static constexpr ScopedSql COUNT_NODES_OF_KIND_METHOD = {
    "SELECT COUNT(*) FROM nodes WHERE project = ? AND kind = 'method';",
    "SELECT COUNT(*) FROM nodes WHERE project = '' AND kind = 'method';"};

static constexpr ScopedSql COUNT_CALL_EDGES = {
    "SELECT COUNT(*) FROM edges WHERE project = ? AND type = 'calls';",
    "SELECT COUNT(*) FROM edges WHERE project = '' AND type = 'calls';"};

static constexpr ScopedSql TOP_CALLERS = {
    "SELECT src, COUNT(*) AS c FROM edges WHERE project = ? AND type = 'calls'"
    " GROUP BY src ORDER BY c DESC, src ASC LIMIT ?;",
    "SELECT src, COUNT(*) AS c FROM edges WHERE project = '' AND type = 'calls'"
    " GROUP BY src ORDER BY c DESC, src ASC LIMIT ?;"};

static constexpr ScopedSql TOP_CALLEES = {
    "SELECT dst, COUNT(*) AS c FROM edges WHERE project = ? AND type = 'calls'"
    " GROUP BY dst ORDER BY c DESC, dst ASC LIMIT ?;",
    "SELECT dst, COUNT(*) AS c FROM edges WHERE project = '' AND type = 'calls'"
    " GROUP BY dst ORDER BY c DESC, dst ASC LIMIT ?;"};

static constexpr ScopedSql SAMPLE_CALL_EDGES = {
    "SELECT src, dst FROM edges WHERE project = ? AND type = 'calls'"
    " ORDER BY src, dst LIMIT ?;",
    "SELECT src, dst FROM edges WHERE project = '' AND type = 'calls'"
    " ORDER BY src, dst LIMIT ?;"};

static constexpr ScopedSql NODE_LABEL = {
    "SELECT label FROM nodes WHERE project = ? AND node_id = ?;",
    "SELECT label FROM nodes WHERE project = '' AND node_id = ?;"};

// neighbors

static constexpr ScopedSql CALLEES_OF = {
    "SELECT dst FROM edges WHERE project = ? AND type = 'calls' AND src = ?"
    " ORDER BY dst LIMIT ?;",
    "SELECT dst FROM edges WHERE project = '' AND type = 'calls' AND src = ?"
    " ORDER BY dst LIMIT ?;"};

static constexpr ScopedSql CALLERS_OF = {
    "SELECT src FROM edges WHERE project = ? AND type = 'calls' AND dst = ?"
    " ORDER BY src LIMIT ?;",
    "SELECT src FROM edges WHERE project = '' AND type = 'calls' AND dst = ?"
    " ORDER BY src LIMIT ?;"};

// file dependencies

static constexpr ScopedSql FILE_DEPENDENCIES = {
    "SELECT DISTINCT s.file_path, d.file_path FROM edges e"
    " JOIN nodes s ON s.project = e.project AND s.node_id = e.src"
    " JOIN nodes d ON d.project = e.project AND d.node_id = e.dst"
    " WHERE e.project = ? AND e.type = 'calls'"
    " AND s.file_path IS NOT NULL AND d.file_path IS NOT NULL"
    " AND s.file_path <> d.file_path"
    " ORDER BY 1, 2;",
    "SELECT DISTINCT s.file_path, d.file_path FROM edges e"
    " JOIN nodes s ON s.project = e.project AND s.node_id = e.src"
    " JOIN nodes d ON d.project = e.project AND d.node_id = e.dst"
    " WHERE e.project = '' AND e.type = 'calls'"
    " AND s.file_path IS NOT NULL AND d.file_path IS NOT NULL"
    " AND s.file_path <> d.file_path"
    " ORDER BY 1, 2;"};

// bookkeeping

static constexpr const char* UPSERT_FILE_STATUS =
    "INSERT INTO file_status(project,file_path,file_hash,status,updated_at_ms)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(project,file_path) DO UPDATE SET"
    " file_hash=excluded.file_hash,"
    " status=excluded.status,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr ScopedSql SELECT_FILE_STATUS = {
    "SELECT file_path,file_hash,status,updated_at_ms FROM file_status"
    " WHERE project = ? AND file_path = ?;",
    "SELECT file_path,file_hash,status,updated_at_ms FROM file_status"
    " WHERE project = '' AND file_path = ?;"};

static constexpr ScopedSql LIST_FILE_STATUS = {
    "SELECT file_path,file_hash,status,updated_at_ms FROM file_status"
    " WHERE project = ? ORDER BY file_path;",
    "SELECT file_path,file_hash,status,updated_at_ms FROM file_status"
    " WHERE project = '' ORDER BY file_path;"};

static constexpr const char* UPSERT_INDEXING_JOB =
    "INSERT INTO indexing_jobs(project,status,started_at_ms,finished_at_ms,error,total_files,processed_files,step)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(project) DO UPDATE SET"
    " status=excluded.status,"
    " started_at_ms=excluded.started_at_ms,"
    " finished_at_ms=excluded.finished_at_ms,"
    " error=excluded.error,"
    " total_files=excluded.total_files,"
    " processed_files=excluded.processed_files,"
    " step=excluded.step;";

static constexpr ScopedSql SELECT_INDEXING_JOB = {
    "SELECT status,started_at_ms,finished_at_ms,error,total_files,processed_files,step"
    " FROM indexing_jobs WHERE project = ?;",
    "SELECT status,started_at_ms,finished_at_ms,error,total_files,processed_files,step"
    " FROM indexing_jobs WHERE project = '';"};

} // namespace codeintel::db::sql
