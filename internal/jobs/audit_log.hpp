#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace codeintel::jobs {

/*
  Per-job, append-only audit trail of source edits.

  File: <log_dir>/postimplementation_<YYYYmmdd_HHMMSS_ffffffZ>_<session>.log
  Change lines are TAB separated:
    <iso8601>  UPDATED_JAVADOC  file=..  type=..  signature=..  reason=..
*/
class AuditLog {
 public:
  // Creates the directory and an empty log file. An empty session id gets a random suffix.
  static std::shared_ptr<AuditLog> Create(const std::filesystem::path& log_dir, const std::string& session_id);

  explicit AuditLog(std::filesystem::path path);

  const std::filesystem::path& Path() const {
    return path_;
  }

  void WriteHeader(const std::string& root_dir, const std::string& session_id);

  void AppendChange(const std::string& file_path, const std::string& signature, const std::string& member_type, const std::string& reason);

  void AppendLine(std::string_view line);

 private:
  std::filesystem::path path_;
  std::mutex            mutex_;
};

// Accepts bare file names only; rejects empty, "." / ".." and anything with a separator.
std::optional<std::string> SafeLogFilename(std::string_view name);

// Log file of `session_id` inside `log_dir`, if one exists.
std::optional<std::filesystem::path> FindSessionLog(const std::filesystem::path& log_dir, const std::string& session_id);

std::string ReadLogFile(const std::filesystem::path& path);

} // namespace codeintel::jobs
