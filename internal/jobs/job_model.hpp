#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace codeintel::jobs {

enum class JobStatus { Running, Completed, Failed, Stopped };

inline const char* ToString(JobStatus status) {
  switch (status) {
    case JobStatus::Running:
      return "running";
    case JobStatus::Completed:
      return "completed";
    case JobStatus::Failed:
      return "failed";
    case JobStatus::Stopped:
      return "stopped";
  }
  return "unknown";
}

inline bool IsTerminal(JobStatus status) {
  return status != JobStatus::Running;
}

struct JobOptions {
  // existing doc blocks with fewer meaningful lines are regenerated
  int                      min_meaningful_lines = 3;
  std::size_t              max_code_chars       = 4000;
  bool                     exclude_tests        = true;
  std::vector<std::string> source_extensions{".java"};
};

struct DocGenerationSummary {
  std::string root_dir;
  std::size_t files_scanned      = 0;
  std::size_t files_modified     = 0;
  std::size_t members_documented = 0;
  std::string log_file;
};

struct Job {
  std::string                         job_id;
  std::string                         root_dir;
  JobStatus                           status = JobStatus::Running;
  util::TimePoint                     created_at;
  std::optional<util::TimePoint>      started_at;
  std::optional<util::TimePoint>      finished_at;
  bool                                stop_requested = false;
  std::string                         log_file;
  std::optional<DocGenerationSummary> summary;
  std::optional<std::string>          error;
};

/*
  Cooperative stop flag shared between the coordinator and one worker.
  The worker polls it between units of work.
*/
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace codeintel::jobs
