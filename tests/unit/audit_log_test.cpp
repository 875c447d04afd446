#include "internal/jobs/audit_log.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using codeintel::jobs::AuditLog;
using codeintel::jobs::FindSessionLog;
using codeintel::jobs::ReadLogFile;
using codeintel::jobs::SafeLogFilename;
using codeintel::testing::CountOccurrences;
using codeintel::testing::TempDir;

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

std::vector<std::string> SplitTabs(const std::string& line) {
  std::vector<std::string> fields;
  std::istringstream       in(line);
  std::string              field;
  while (std::getline(in, field, '\t')) fields.push_back(field);
  return fields;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void TestCreateNamesLogBySession(const TempDir& dir) {
  const auto log_dir = dir / "logs";
  const auto log     = AuditLog::Create(log_dir, "session-1");

  const auto name = log->Path().filename().string();
  assert(StartsWith(name, "postimplementation_"));
  assert(EndsWith(name, "_session-1.log"));
  assert(std::filesystem::exists(log->Path()));
  assert(ReadLogFile(log->Path()).empty());

  // 20260101_120000_123456Z between prefix and session
  const auto stamp = name.substr(std::string("postimplementation_").size(), 23);
  assert(stamp[8] == '_');
  assert(stamp[15] == '_');
  assert(stamp.back() == 'Z');

  const auto anonymous = AuditLog::Create(log_dir, "");
  const auto anon_name = anonymous->Path().filename().string();
  assert(EndsWith(anon_name, ".log"));
  assert(anon_name.size() == name.size() - std::string("session-1").size() + 8);

  bool rejected = false;
  try {
    AuditLog::Create(log_dir, "../escape");
  } catch (const codeintel::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

void TestHeaderAndChangeLines(const TempDir& dir) {
  const auto log = AuditLog::Create(dir / "logs", "fmt");
  log->WriteHeader("/src/project", "fmt");
  log->AppendChange("/src/project/A.java", "public void run()", "method", "missing_javadoc");

  const auto lines = SplitLines(ReadLogFile(log->Path()));
  assert(lines.size() == 5);
  assert(lines[0] == "# postimplementation log");
  assert(StartsWith(lines[1], "# created_utc="));
  assert(EndsWith(lines[1], "+00:00"));
  assert(lines[2] == "# root_dir=/src/project");
  assert(lines[3] == "# session_id=fmt");

  const auto fields = SplitTabs(lines[4]);
  assert(fields.size() == 6);
  assert(fields[0].find('T') != std::string::npos);
  assert(fields[1] == "UPDATED_JAVADOC");
  assert(fields[2] == "file=/src/project/A.java");
  assert(fields[3] == "type=method");
  assert(fields[4] == "signature=public void run()");
  assert(fields[5] == "reason=missing_javadoc");

  // no session line without a session
  const auto bare = AuditLog::Create(dir / "logs", "");
  bare->WriteHeader("/src/other", "");
  assert(CountOccurrences(ReadLogFile(bare->Path()), "session_id") == 0);
}

void TestSafeLogFilename() {
  assert(SafeLogFilename("postimplementation_x.log") == std::optional<std::string>("postimplementation_x.log"));
  assert(!SafeLogFilename(""));
  assert(!SafeLogFilename("."));
  assert(!SafeLogFilename(".."));
  assert(!SafeLogFilename("../etc/passwd"));
  assert(!SafeLogFilename("dir/file.log"));
  assert(!SafeLogFilename("dir\\file.log"));
}

void TestFindSessionLog(const TempDir& dir) {
  const auto log_dir = dir / "find";
  const auto log     = AuditLog::Create(log_dir, "needle");
  AuditLog::Create(log_dir, "haystack");
  codeintel::testing::WriteText(log_dir / "unrelated_needle.log", "x");

  const auto found = FindSessionLog(log_dir, "needle");
  assert(found.has_value());
  assert(*found == log->Path());

  assert(!FindSessionLog(log_dir, "missing"));
  assert(!FindSessionLog(log_dir, ""));
  assert(!FindSessionLog(log_dir, "../needle"));
  assert(!FindSessionLog(dir / "no-such-dir", "needle"));

  bool not_found = false;
  try {
    ReadLogFile(log_dir / "gone.log");
  } catch (const codeintel::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestConcurrentAppendsStayWhole(const TempDir& dir) {
  const auto log = AuditLog::Create(dir / "logs", "concurrent");

  constexpr int            kThreads = 8;
  constexpr int            kLines   = 100;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&log, t] {
      for (int i = 0; i < kLines; ++i) {
        log->AppendLine("thread-" + std::to_string(t) + " line-" + std::to_string(i) + "\n");
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const auto lines = SplitLines(ReadLogFile(log->Path()));
  assert(lines.size() == static_cast<std::size_t>(kThreads * kLines));
  for (const auto& line : lines) {
    assert(StartsWith(line, "thread-"));
    assert(line.find(" line-") != std::string::npos);
    assert(CountOccurrences(line, "thread-") == 1);
  }
}

} // namespace

int main() {
  TempDir dir("codeintel_unit_audit_log");

  TestCreateNamesLogBySession(dir);
  TestHeaderAndChangeLines(dir);
  TestSafeLogFilename();
  TestFindSessionLog(dir);
  TestConcurrentAppendsStayWhole(dir);

  std::cout << "codeintel_unit_audit_log: pass\n";
  return 0;
}
