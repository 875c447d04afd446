#pragma once

namespace codeintel::db::sql {

/*
  Conversation checkpoint SQL (SQLite dialect).

  Every row is scoped by (thread_id, checkpoint_ns); the default
  namespace is the empty string.
*/

static constexpr const char* CHECKPOINT_SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS checkpoints ("
    " thread_id TEXT NOT NULL,"
    " checkpoint_ns TEXT NOT NULL,"
    " checkpoint_id TEXT NOT NULL,"
    " parent_checkpoint_id TEXT NULL,"
    " checkpoint_type TEXT NOT NULL,"
    " checkpoint_blob BLOB NOT NULL,"
    " metadata_type TEXT NOT NULL,"
    " metadata_blob BLOB NOT NULL,"
    " PRIMARY KEY(thread_id, checkpoint_ns, checkpoint_id));",

    "CREATE INDEX IF NOT EXISTS idx_checkpoints_latest"
    " ON checkpoints(thread_id, checkpoint_ns, checkpoint_id DESC);",

    "CREATE TABLE IF NOT EXISTS blobs ("
    " thread_id TEXT NOT NULL,"
    " checkpoint_ns TEXT NOT NULL,"
    " channel TEXT NOT NULL,"
    " version TEXT NOT NULL,"
    " value_type TEXT NOT NULL,"
    " value_blob BLOB NOT NULL,"
    " PRIMARY KEY(thread_id, checkpoint_ns, channel, version));",

    "CREATE TABLE IF NOT EXISTS writes ("
    " thread_id TEXT NOT NULL,"
    " checkpoint_ns TEXT NOT NULL,"
    " checkpoint_id TEXT NOT NULL,"
    " task_id TEXT NOT NULL,"
    " write_idx INTEGER NOT NULL,"
    " channel TEXT NOT NULL,"
    " value_type TEXT NOT NULL,"
    " value_blob BLOB NOT NULL,"
    " task_path TEXT NOT NULL DEFAULT '',"
    " PRIMARY KEY(thread_id, checkpoint_ns, checkpoint_id, task_id, write_idx));",
};

// checkpoints

static constexpr const char* SELECT_CHECKPOINT =
    "SELECT checkpoint_id,parent_checkpoint_id,checkpoint_type,checkpoint_blob,metadata_type,metadata_blob"
    " FROM checkpoints WHERE thread_id=? AND checkpoint_ns=? AND checkpoint_id=?;";

static constexpr const char* SELECT_LATEST_CHECKPOINT =
    "SELECT checkpoint_id,parent_checkpoint_id,checkpoint_type,checkpoint_blob,metadata_type,metadata_blob"
    " FROM checkpoints WHERE thread_id=? AND checkpoint_ns=?"
    " ORDER BY checkpoint_id DESC LIMIT 1;";

// LIMIT -1 means unbounded in sqlite
static constexpr const char* LIST_CHECKPOINT_IDS =
    "SELECT checkpoint_id FROM checkpoints WHERE thread_id=? AND checkpoint_ns=?"
    " ORDER BY checkpoint_id DESC LIMIT ?;";

static constexpr const char* LIST_CHECKPOINT_IDS_BEFORE =
    "SELECT checkpoint_id FROM checkpoints WHERE thread_id=? AND checkpoint_ns=? AND checkpoint_id < ?"
    " ORDER BY checkpoint_id DESC LIMIT ?;";

static constexpr const char* UPSERT_CHECKPOINT =
    "INSERT OR REPLACE INTO checkpoints(thread_id,checkpoint_ns,checkpoint_id,parent_checkpoint_id,"
    "checkpoint_type,checkpoint_blob,metadata_type,metadata_blob) VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* LIST_THREADS_IN_NAMESPACE =
    "SELECT DISTINCT thread_id FROM checkpoints WHERE checkpoint_ns=? ORDER BY thread_id;";

// ids past the newest N (bound as OFFSET)
static constexpr const char* SELECT_EXPIRED_CHECKPOINT_IDS =
    "SELECT checkpoint_id FROM checkpoints WHERE thread_id=? AND checkpoint_ns=?"
    " ORDER BY checkpoint_id DESC LIMIT -1 OFFSET ?;";

static constexpr const char* SELECT_CHECKPOINT_BODIES =
    "SELECT checkpoint_type,checkpoint_blob FROM checkpoints WHERE thread_id=? AND checkpoint_ns=?;";

static constexpr const char* DELETE_CHECKPOINT =
    "DELETE FROM checkpoints WHERE thread_id=? AND checkpoint_ns=? AND checkpoint_id=?;";

// blobs

static constexpr const char* SELECT_BLOB =
    "SELECT value_type,value_blob FROM blobs"
    " WHERE thread_id=? AND checkpoint_ns=? AND channel=? AND version=?;";

static constexpr const char* UPSERT_BLOB =
    "INSERT OR REPLACE INTO blobs(thread_id,checkpoint_ns,channel,version,value_type,value_blob)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_BLOB_KEYS =
    "SELECT channel,version FROM blobs WHERE thread_id=? AND checkpoint_ns=?;";

static constexpr const char* DELETE_BLOB =
    "DELETE FROM blobs WHERE thread_id=? AND checkpoint_ns=? AND channel=? AND version=?;";

// pending writes

static constexpr const char* SELECT_WRITES =
    "SELECT task_id,channel,value_type,value_blob,task_path FROM writes"
    " WHERE thread_id=? AND checkpoint_ns=? AND checkpoint_id=?"
    " ORDER BY task_id ASC, write_idx ASC;";

static constexpr const char* REPLACE_WRITE =
    "INSERT OR REPLACE INTO writes(thread_id,checkpoint_ns,checkpoint_id,task_id,write_idx,"
    "channel,value_type,value_blob,task_path) VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_WRITE_IF_ABSENT =
    "INSERT OR IGNORE INTO writes(thread_id,checkpoint_ns,checkpoint_id,task_id,write_idx,"
    "channel,value_type,value_blob,task_path) VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* DELETE_WRITES_FOR_CHECKPOINT =
    "DELETE FROM writes WHERE thread_id=? AND checkpoint_ns=? AND checkpoint_id=?;";

// thread deletion, children first

static constexpr const char* DELETE_THREAD[] = {
    "DELETE FROM writes WHERE thread_id=?;",
    "DELETE FROM blobs WHERE thread_id=?;",
    "DELETE FROM checkpoints WHERE thread_id=?;",
};

static constexpr const char* DELETE_THREAD_NAMESPACE[] = {
    "DELETE FROM writes WHERE thread_id=? AND checkpoint_ns=?;",
    "DELETE FROM blobs WHERE thread_id=? AND checkpoint_ns=?;",
    "DELETE FROM checkpoints WHERE thread_id=? AND checkpoint_ns=?;",
};

} // namespace codeintel::db::sql
