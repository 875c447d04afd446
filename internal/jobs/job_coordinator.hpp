#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/jobs/audit_log.hpp"
#include "internal/jobs/doc_generation.hpp"
#include "internal/jobs/job_model.hpp"

namespace codeintel::jobs {

struct JobCoordinatorConfig {
  std::filesystem::path log_dir = "./postimplementation_logs";

  // terminal jobs kept in memory; 0 keeps all
  std::size_t max_finished_jobs = 0;
};

/*
  Runs documentation passes on background threads.

  At most one running job per directory tree: a root that equals,
  contains or is contained by a running job's root is rejected with
  util::Conflict. Stop() is cooperative and non-blocking; Shutdown()
  (also run by the destructor) cancels and joins every worker.
*/
class JobCoordinator {
 public:
  JobCoordinator(std::shared_ptr<const MemberSource> source,
                 std::shared_ptr<MemberDocumenter>   documenter,
                 JobCoordinatorConfig                config = {});
  ~JobCoordinator();

  JobCoordinator(const JobCoordinator&)            = delete;
  JobCoordinator& operator=(const JobCoordinator&) = delete;

  // `documenter` overrides the default one for this job only.
  Job Start(const std::string& root_dir, const JobOptions& options, std::shared_ptr<MemberDocumenter> documenter = nullptr);

  // Newest first.
  std::vector<Job> List() const;

  std::optional<Job> Get(const std::string& job_id) const;

  Job Stop(const std::string& job_id);

  std::string ReadLog(const std::string& job_id) const;

  void Shutdown();

 private:
  struct Entry {
    Job                                job;
    std::filesystem::path              root;
    JobOptions                         options;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<AuditLog>          log;
    std::shared_ptr<MemberDocumenter>  documenter;
    std::thread                        worker;
  };

  void Run(const std::string& job_id);

  // Drops the oldest terminal jobs beyond max_finished_jobs; returns their workers.
  std::vector<std::thread> EvictFinishedLocked();

  std::shared_ptr<const MemberSource> source_;
  std::shared_ptr<MemberDocumenter>   documenter_;
  JobCoordinatorConfig                config_;

  mutable std::mutex                            mutex_;
  std::map<std::string, std::unique_ptr<Entry>> jobs_;
  bool                                          shut_down_ = false;
};

// True when one path equals or contains the other, compared by component.
bool PathsOverlap(const std::filesystem::path& a, const std::filesystem::path& b);

} // namespace codeintel::jobs
