#include "internal/jobs/job_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace codeintel::jobs {

namespace fs = std::filesystem;

using observability::StringField;

namespace {

bool IsWithin(const fs::path& child, const fs::path& parent) {
  return std::mismatch(parent.begin(), parent.end(), child.begin(), child.end()).first == parent.end();
}

void JoinAll(std::vector<std::thread>& workers) {
  for (auto& worker : workers) {
    if (worker.joinable()) worker.join();
  }
}

} // namespace

bool PathsOverlap(const fs::path& a, const fs::path& b) {
  return IsWithin(a, b) || IsWithin(b, a);
}

JobCoordinator::JobCoordinator(std::shared_ptr<const MemberSource> source,
                               std::shared_ptr<MemberDocumenter>   documenter,
                               JobCoordinatorConfig                config)
    : source_(std::move(source)), documenter_(std::move(documenter)), config_(std::move(config)) {
  if (!source_) {
    throw util::InvalidArgument("JobCoordinator: member source is required");
  }
}

JobCoordinator::~JobCoordinator() {
  Shutdown();
}

Job JobCoordinator::Start(const std::string& root_dir, const JobOptions& options, std::shared_ptr<MemberDocumenter> documenter) {
  if (!documenter) documenter = documenter_;
  if (!documenter) {
    throw util::InvalidArgument("no documenter configured");
  }

  std::error_code ec;
  if (root_dir.empty() || !fs::is_directory(root_dir, ec)) {
    throw util::InvalidArgument("not a directory: " + root_dir);
  }
  const auto root = fs::canonical(root_dir);

  std::vector<std::thread> evicted;
  Job                      snapshot;
  {
    std::lock_guard lock(mutex_);
    if (shut_down_) {
      throw std::runtime_error("job coordinator is shut down");
    }

    for (const auto& [id, entry] : jobs_) {
      if (entry->job.status != JobStatus::Running) continue;
      if (PathsOverlap(root, entry->root)) {
        throw util::Conflict("a documentation job is already running for '" + entry->job.root_dir + "' (requested: '" + root.string() + "')");
      }
    }

    evicted = EvictFinishedLocked();

    auto entry        = std::make_unique<Entry>();
    entry->job.job_id = util::ToHex(util::GenerateUUID());
    entry->log        = AuditLog::Create(config_.log_dir, entry->job.job_id);
    entry->log->WriteHeader(root.string(), entry->job.job_id);

    entry->job.root_dir   = root.string();
    entry->job.status     = JobStatus::Running;
    entry->job.created_at = util::Now();
    entry->job.started_at = entry->job.created_at;
    entry->job.log_file   = entry->log->Path().string();
    entry->root           = root;
    entry->options        = options;
    entry->token          = std::make_shared<CancellationToken>();
    entry->documenter     = std::move(documenter);

    snapshot  = entry->job;
    auto* raw = entry.get();
    jobs_.emplace(snapshot.job_id, std::move(entry));
    raw->worker = std::thread(&JobCoordinator::Run, this, snapshot.job_id);
  }
  JoinAll(evicted);

  CODEINTEL_LOG_INFO("documentation job started", {StringField("job_id", snapshot.job_id), StringField("root_dir", snapshot.root_dir)});
  return snapshot;
}

std::vector<Job> JobCoordinator::List() const {
  std::vector<Job> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(jobs_.size());
    for (const auto& [id, entry] : jobs_) {
      out.push_back(entry->job);
    }
  }
  std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.job_id < b.job_id;
  });
  return out;
}

std::optional<Job> JobCoordinator::Get(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->job;
}

Job JobCoordinator::Stop(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("unknown job: " + job_id);
  }

  auto& entry = *it->second;
  if (IsTerminal(entry.job.status)) {
    return entry.job;
  }

  entry.job.stop_requested = true;
  entry.token->Cancel();
  CODEINTEL_LOG_INFO("documentation job stop requested", {StringField("job_id", job_id)});
  return entry.job;
}

std::string JobCoordinator::ReadLog(const std::string& job_id) const {
  std::optional<fs::path> path;
  {
    std::lock_guard lock(mutex_);
    if (auto it = jobs_.find(job_id); it != jobs_.end()) {
      path = it->second->job.log_file;
    }
  }

  // evicted or from an earlier process
  if (!path) path = FindSessionLog(config_.log_dir, job_id);
  if (!path) {
    throw util::NotFound("unknown job: " + job_id);
  }
  return ReadLogFile(*path);
}

void JobCoordinator::Shutdown() {
  std::vector<std::thread> workers;
  {
    std::lock_guard lock(mutex_);
    shut_down_ = true;
    for (auto& [id, entry] : jobs_) {
      if (!IsTerminal(entry->job.status)) {
        entry->job.stop_requested = true;
        entry->token->Cancel();
      }
      if (entry->worker.joinable()) {
        workers.push_back(std::move(entry->worker));
      }
    }
  }
  JoinAll(workers);
}

void JobCoordinator::Run(const std::string& job_id) {
  std::filesystem::path              root;
  JobOptions                         options;
  std::shared_ptr<CancellationToken> token;
  std::shared_ptr<AuditLog>          log;
  std::shared_ptr<MemberDocumenter>  documenter;
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    if (it == jobs_.end()) return;
    root       = it->second->root;
    options    = it->second->options;
    token      = it->second->token;
    log        = it->second->log;
    documenter = it->second->documenter;
  }

  std::optional<DocGenerationSummary> summary;
  std::optional<std::string>          error;
  try {
    summary = RunDocumentationPass(root, options, *source_, *documenter, *log, *token);
  } catch (const std::exception& e) {
    error = e.what();
  }

  JobStatus status;
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    if (it == jobs_.end()) return;

    auto& job       = it->second->job;
    job.finished_at = util::Now();
    if (error) {
      job.status = JobStatus::Failed;
      job.error  = error;
    } else {
      job.summary = summary;
      job.status  = job.stop_requested || token->IsCancelled() ? JobStatus::Stopped : JobStatus::Completed;
    }
    status = job.status;
  }

  if (error) {
    CODEINTEL_LOG_ERROR("documentation job failed", {StringField("job_id", job_id), StringField("error", *error)});
  } else {
    CODEINTEL_LOG_INFO("documentation job finished", {StringField("job_id", job_id), StringField("status", ToString(status))});
  }
}

std::vector<std::thread> JobCoordinator::EvictFinishedLocked() {
  std::vector<std::thread> workers;
  if (config_.max_finished_jobs == 0) return workers;

  std::vector<Entry*> finished;
  for (auto& [id, entry] : jobs_) {
    if (IsTerminal(entry->job.status)) finished.push_back(entry.get());
  }
  if (finished.size() < config_.max_finished_jobs) return workers;

  // oldest first; make room for the job about to start
  std::sort(finished.begin(), finished.end(), [](const Entry* a, const Entry* b) {
    if (a->job.created_at != b->job.created_at) return a->job.created_at < b->job.created_at;
    return a->job.job_id < b->job.job_id;
  });
  const auto excess = finished.size() - config_.max_finished_jobs + 1;
  for (std::size_t i = 0; i < excess; ++i) {
    auto node = jobs_.extract(finished[i]->job.job_id);
    if (node.mapped()->worker.joinable()) {
      workers.push_back(std::move(node.mapped()->worker));
    }
  }
  return workers;
}

} // namespace codeintel::jobs
