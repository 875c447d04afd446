#include "internal/checkpoint/sqlite_checkpoint_saver.hpp"

#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/checkpoint_sql.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace codeintel::checkpoint {

namespace sql = db::sql;

using db::ThrowIfDbError;
using db::sqlite::SqliteDB;
using db::sqlite::SqliteStmt;
using db::sqlite::SqliteTransaction;
using observability::CountField;
using observability::IntField;
using observability::StringField;

namespace {

void RequireThread(const std::string& thread_id) {
  if (thread_id.empty()) {
    throw util::InvalidArgument("missing required config: thread_id");
  }
}

std::string Serialize(const google::protobuf::MessageLite& message, const char* what) {
  std::string out;
  if (!message.SerializeToString(&out)) {
    throw std::runtime_error(std::string("failed to serialize ") + what);
  }
  return out;
}

template <typename Message>
Message Parse(const std::string& type, const std::string& bytes, const char* what) {
  if (type != kProtobufValueType) {
    throw std::runtime_error(std::string("unsupported ") + what + " encoding: " + type);
  }
  Message message;
  if (!message.ParseFromString(bytes)) {
    throw std::runtime_error(std::string("corrupt ") + what + " payload");
  }
  return message;
}

void BindScope(SqliteStmt& st, const std::string& thread_id, const std::string& checkpoint_ns) {
  st.BindText(1, thread_id);
  st.BindText(2, checkpoint_ns);
}

} // namespace

SqliteCheckpointSaver::SqliteCheckpointSaver(std::string sqlite_path, std::size_t keep_latest)
    : path_(std::move(sqlite_path)), keep_latest_(keep_latest) {
  db::sqlite::EnsureParentDirectory(path_);

  auto db = Connect();
  sql::RunMigrations(*db, "checkpoint", sql::CHECKPOINT_SCHEMA);
}

std::shared_ptr<SqliteDB> SqliteCheckpointSaver::Connect() const {
  return std::make_shared<SqliteDB>(path_);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<CheckpointTuple> SqliteCheckpointSaver::GetTuple(const CheckpointConfig& config) const {
  RequireThread(config.thread_id);
  const auto& thread_id = config.thread_id;
  const auto& ns        = config.checkpoint_ns;
  const bool  exact     = config.checkpoint_id && !config.checkpoint_id->empty();

  auto  db = Connect();
  auto* h  = db->Handle();

  CheckpointTuple tuple;
  {
    SqliteStmt q(h, exact ? sql::SELECT_CHECKPOINT : sql::SELECT_LATEST_CHECKPOINT);
    BindScope(q, thread_id, ns);
    if (exact) q.BindText(3, *config.checkpoint_id);
    if (!q.Next()) return std::nullopt;

    tuple.config          = CheckpointConfig{thread_id, ns, q.ColText(0)};
    const auto parent     = q.ColOptionalText(1);
    tuple.checkpoint.body = Parse<v1::CheckpointBody>(q.ColText(2), q.ColBlob(3), "checkpoint");
    tuple.metadata        = Parse<CheckpointMetadata>(q.ColText(4), q.ColBlob(5), "metadata");
    if (parent && !parent->empty()) {
      tuple.parent_config = CheckpointConfig{thread_id, ns, parent};
    }
  }

  // a missing blob leaves the channel unset
  SqliteStmt blob(h, sql::SELECT_BLOB);
  for (const auto& [channel, version] : tuple.checkpoint.body.channel_versions()) {
    blob.Reset();
    BindScope(blob, thread_id, ns);
    blob.BindText(3, channel);
    blob.BindText(4, version);
    if (!blob.Next()) continue;

    TypedValue value{blob.ColText(0), blob.ColBlob(1)};
    if (value.IsEmpty()) continue;
    tuple.checkpoint.channel_values.emplace(channel, std::move(value));
  }

  SqliteStmt writes(h, sql::SELECT_WRITES);
  BindScope(writes, thread_id, ns);
  writes.BindText(3, *tuple.config.checkpoint_id);
  while (writes.Next()) {
    PendingWrite w;
    w.task_id   = writes.ColText(0);
    w.channel   = writes.ColText(1);
    w.value     = TypedValue{writes.ColText(2), writes.ColBlob(3)};
    w.task_path = writes.ColText(4);
    tuple.pending_writes.push_back(std::move(w));
  }

  return tuple;
}

CheckpointSequence SqliteCheckpointSaver::List(const CheckpointConfig&           config,
                                               const std::optional<std::string>& before,
                                               std::optional<std::size_t>        limit) const {
  if (config.thread_id.empty()) {
    return CheckpointSequence(*this, config, {});
  }
  const bool has_before = before && !before->empty();

  auto db = Connect();

  SqliteStmt q(db->Handle(), has_before ? sql::LIST_CHECKPOINT_IDS_BEFORE : sql::LIST_CHECKPOINT_IDS);
  BindScope(q, config.thread_id, config.checkpoint_ns);
  int idx = 3;
  if (has_before) q.BindText(idx++, *before);
  q.BindInt64(idx, limit ? static_cast<int64_t>(*limit) : -1);

  std::vector<std::string> ids;
  while (q.Next()) {
    ids.push_back(q.ColText(0));
  }

  return CheckpointSequence(*this, CheckpointConfig{config.thread_id, config.checkpoint_ns, std::nullopt}, std::move(ids));
}

std::vector<std::string> SqliteCheckpointSaver::ListThreadsNamespace(const std::string& checkpoint_ns) const {
  auto db = Connect();

  SqliteStmt q(db->Handle(), sql::LIST_THREADS_IN_NAMESPACE);
  q.BindText(1, checkpoint_ns);

  std::vector<std::string> out;
  while (q.Next()) {
    out.push_back(q.ColText(0));
  }
  return out;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

CheckpointConfig SqliteCheckpointSaver::Put(const CheckpointConfig&   config,
                                            const Checkpoint&         checkpoint,
                                            const CheckpointMetadata& metadata,
                                            const ChannelVersions&    new_versions) {
  RequireThread(config.thread_id);
  const auto& thread_id     = config.thread_id;
  const auto& ns            = config.checkpoint_ns;
  const auto& checkpoint_id = checkpoint.body.id();
  if (checkpoint_id.empty()) {
    throw util::InvalidArgument("checkpoint id is required");
  }

  const auto body_bytes     = Serialize(checkpoint.body, "checkpoint");
  const auto metadata_bytes = Serialize(metadata, "metadata");

  std::lock_guard lock(write_mutex_);
  auto            db = Connect();
  auto*           h  = db->Handle();

  SqliteTransaction tx(db);
  {
    SqliteStmt blob(h, sql::UPSERT_BLOB);
    for (const auto& [channel, version] : new_versions) {
      const auto it    = checkpoint.channel_values.find(channel);
      const auto value = it != checkpoint.channel_values.end() ? it->second : TypedValue{kEmptyValueType, ""};

      BindScope(blob, thread_id, ns);
      blob.BindText(3, channel);
      blob.BindText(4, version);
      blob.BindText(5, value.type);
      blob.BindBlob(6, value.payload);
      ThrowIfDbError(blob.Run(), "write blob " + channel);
      blob.Reset();
    }

    SqliteStmt row(h, sql::UPSERT_CHECKPOINT);
    BindScope(row, thread_id, ns);
    row.BindText(3, checkpoint_id);
    row.BindOptionalText(4, config.checkpoint_id);
    row.BindText(5, kProtobufValueType);
    row.BindBlob(6, body_bytes);
    row.BindText(7, kProtobufValueType);
    row.BindBlob(8, metadata_bytes);
    ThrowIfDbError(row.Run(), "write checkpoint " + checkpoint_id);
  }
  tx.Commit();

  CODEINTEL_LOG_DEBUG("checkpoint stored",
                      {StringField("thread_id", thread_id),
                       StringField("checkpoint_id", checkpoint_id),
                       IntField("step", metadata.step()),
                       CountField("blobs", new_versions.size())});

  if (keep_latest_ > 0) {
    PruneLocked(db, thread_id, ns, keep_latest_);
  }

  return CheckpointConfig{thread_id, ns, checkpoint_id};
}

void SqliteCheckpointSaver::PutWrites(const CheckpointConfig&          config,
                                      const std::vector<ChannelWrite>& writes,
                                      const std::string&               task_id,
                                      const std::string&               task_path) {
  RequireThread(config.thread_id);
  if (!config.checkpoint_id || config.checkpoint_id->empty()) {
    throw util::InvalidArgument("missing required config: checkpoint_id");
  }

  std::lock_guard lock(write_mutex_);
  auto            db = Connect();
  auto*           h  = db->Handle();

  SqliteTransaction tx(db);
  {
    // reserved channels overwrite; positional writes keep the first value
    SqliteStmt replace(h, sql::REPLACE_WRITE);
    SqliteStmt insert(h, sql::INSERT_WRITE_IF_ABSENT);

    for (std::size_t i = 0; i < writes.size(); ++i) {
      const auto& w        = writes[i];
      const auto  reserved = ReservedWriteIndex(w.channel);
      auto&       st       = reserved ? replace : insert;

      BindScope(st, config.thread_id, config.checkpoint_ns);
      st.BindText(3, *config.checkpoint_id);
      st.BindText(4, task_id);
      st.BindInt64(5, reserved ? *reserved : static_cast<int64_t>(i));
      st.BindText(6, w.channel);
      st.BindText(7, w.value.type);
      st.BindBlob(8, w.value.payload);
      st.BindText(9, task_path);
      ThrowIfDbError(st.Run(), "write pending value " + w.channel);
      st.Reset();
    }
  }
  tx.Commit();
}

void SqliteCheckpointSaver::DeleteThread(const std::string& thread_id) {
  RequireThread(thread_id);

  std::lock_guard lock(write_mutex_);
  auto            db = Connect();

  SqliteTransaction tx(db);
  for (const char* statement : sql::DELETE_THREAD) {
    SqliteStmt st(db->Handle(), statement);
    st.BindText(1, thread_id);
    ThrowIfDbError(st.Run(), "delete thread " + thread_id);
  }
  tx.Commit();

  CODEINTEL_LOG_INFO("checkpoint thread deleted", {StringField("thread_id", thread_id)});
}

void SqliteCheckpointSaver::DeleteThreadNamespace(const std::string& thread_id, const std::string& checkpoint_ns) {
  RequireThread(thread_id);

  std::lock_guard lock(write_mutex_);
  auto            db = Connect();

  SqliteTransaction tx(db);
  for (const char* statement : sql::DELETE_THREAD_NAMESPACE) {
    SqliteStmt st(db->Handle(), statement);
    BindScope(st, thread_id, checkpoint_ns);
    ThrowIfDbError(st.Run(), "delete thread " + thread_id);
  }
  tx.Commit();

  CODEINTEL_LOG_INFO("checkpoint thread namespace deleted",
                     {StringField("thread_id", thread_id), StringField("checkpoint_ns", checkpoint_ns)});
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

std::size_t SqliteCheckpointSaver::PruneThreadNamespace(const std::string& thread_id, const std::string& checkpoint_ns, std::size_t keep_latest) {
  RequireThread(thread_id);
  if (keep_latest == 0) {
    throw util::InvalidArgument("keep_latest must be at least 1");
  }

  std::lock_guard lock(write_mutex_);
  return PruneLocked(Connect(), thread_id, checkpoint_ns, keep_latest);
}

std::size_t SqliteCheckpointSaver::PruneLocked(const std::shared_ptr<SqliteDB>& db,
                                               const std::string&               thread_id,
                                               const std::string&               checkpoint_ns,
                                               std::size_t                      keep_latest) {
  auto*       h       = db->Handle();
  std::size_t removed = 0;

  SqliteTransaction tx(db);
  {
    std::vector<std::string> expired;
    SqliteStmt               q(h, sql::SELECT_EXPIRED_CHECKPOINT_IDS);
    BindScope(q, thread_id, checkpoint_ns);
    q.BindInt64(3, static_cast<int64_t>(keep_latest));
    while (q.Next()) {
      expired.push_back(q.ColText(0));
    }

    SqliteStmt delete_writes(h, sql::DELETE_WRITES_FOR_CHECKPOINT);
    SqliteStmt delete_checkpoint(h, sql::DELETE_CHECKPOINT);
    for (const auto& id : expired) {
      for (auto* st : {&delete_writes, &delete_checkpoint}) {
        BindScope(*st, thread_id, checkpoint_ns);
        st->BindText(3, id);
        ThrowIfDbError(st->Run(), "prune checkpoint " + id);
        st->Reset();
      }
      removed += static_cast<std::size_t>(db->Changes());
    }

    // blobs survive while any remaining checkpoint references them
    std::set<std::pair<std::string, std::string>> live;
    SqliteStmt                                    bodies(h, sql::SELECT_CHECKPOINT_BODIES);
    BindScope(bodies, thread_id, checkpoint_ns);
    while (bodies.Next()) {
      const auto body = Parse<v1::CheckpointBody>(bodies.ColText(0), bodies.ColBlob(1), "checkpoint");
      for (const auto& [channel, version] : body.channel_versions()) {
        live.emplace(channel, version);
      }
    }

    std::vector<std::pair<std::string, std::string>> orphans;
    SqliteStmt                                       keys(h, sql::SELECT_BLOB_KEYS);
    BindScope(keys, thread_id, checkpoint_ns);
    while (keys.Next()) {
      auto key = std::make_pair(keys.ColText(0), keys.ColText(1));
      if (!live.count(key)) orphans.push_back(std::move(key));
    }

    SqliteStmt delete_blob(h, sql::DELETE_BLOB);
    for (const auto& [channel, version] : orphans) {
      BindScope(delete_blob, thread_id, checkpoint_ns);
      delete_blob.BindText(3, channel);
      delete_blob.BindText(4, version);
      ThrowIfDbError(delete_blob.Run(), "prune blob " + channel);
      delete_blob.Reset();
    }
  }
  tx.Commit();

  if (removed > 0) {
    CODEINTEL_LOG_INFO("checkpoints pruned",
                       {StringField("thread_id", thread_id),
                        StringField("checkpoint_ns", checkpoint_ns),
                        CountField("removed", removed),
                        CountField("kept", keep_latest)});
  }
  return removed;
}

} // namespace codeintel::checkpoint
