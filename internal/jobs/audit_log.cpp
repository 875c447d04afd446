#include "internal/jobs/audit_log.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace codeintel::jobs {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kLogPrefix = "postimplementation_";
constexpr std::string_view kLogSuffix = ".log";

} // namespace

std::shared_ptr<AuditLog> AuditLog::Create(const fs::path& log_dir, const std::string& session_id) {
  fs::create_directories(log_dir);

  const auto suffix = session_id.empty() ? util::RandomHex(8) : session_id;
  const auto name   = std::string(kLogPrefix) + util::FormatCompactUtc(util::Now()) + "_" + suffix + std::string(kLogSuffix);
  if (!SafeLogFilename(name)) {
    throw util::InvalidArgument("invalid session id for log file: " + session_id);
  }

  auto log = std::make_shared<AuditLog>(log_dir / name);
  std::ofstream touch(log->Path(), std::ios::app);
  if (!touch) {
    throw std::runtime_error("cannot create audit log " + log->Path().string());
  }
  return log;
}

AuditLog::AuditLog(fs::path path) : path_(std::move(path)) {
}

void AuditLog::WriteHeader(const std::string& root_dir, const std::string& session_id) {
  AppendLine("# postimplementation log");
  AppendLine("# created_utc=" + util::FormatIso8601Utc(util::Now()));
  AppendLine("# root_dir=" + root_dir);
  if (!session_id.empty()) {
    AppendLine("# session_id=" + session_id);
  }
}

void AuditLog::AppendChange(const std::string& file_path, const std::string& signature, const std::string& member_type, const std::string& reason) {
  std::ostringstream line;
  line << util::FormatIso8601Utc(util::Now()) << "\tUPDATED_JAVADOC"
       << "\tfile=" << file_path << "\ttype=" << member_type << "\tsignature=" << signature << "\treason=" << reason;
  AppendLine(line.str());
}

void AuditLog::AppendLine(std::string_view line) {
  while (!line.empty() && line.back() == '\n') line.remove_suffix(1);

  std::lock_guard lock(mutex_);
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path());
  }
  std::ofstream out(path_, std::ios::app | std::ios::binary);
  out << line << '\n';
  if (!out) {
    throw std::runtime_error("cannot append to audit log " + path_.string());
  }
}

std::optional<std::string> SafeLogFilename(std::string_view name) {
  if (name.empty() || name == "." || name == "..") return std::nullopt;
  if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) return std::nullopt;
  return std::string(name);
}

std::optional<fs::path> FindSessionLog(const fs::path& log_dir, const std::string& session_id) {
  if (session_id.empty() || !SafeLogFilename(session_id)) return std::nullopt;

  std::error_code ec;
  if (!fs::is_directory(log_dir, ec)) return std::nullopt;

  const auto tail = "_" + session_id + std::string(kLogSuffix);
  for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
    const auto name = entry.path().filename().string();
    if (name.size() > kLogPrefix.size() + tail.size() && name.compare(0, kLogPrefix.size(), kLogPrefix) == 0 &&
        name.compare(name.size() - tail.size(), tail.size(), tail) == 0) {
      return entry.path();
    }
  }
  return std::nullopt;
}

std::string ReadLogFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("log file not found: " + path.string());
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

} // namespace codeintel::jobs
