#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace codeintel::runtime::config {
class RuntimeConfig;
}

namespace codeintel::observability {

/*
  Structured logging on top of spdlog.

  Messages are fixed strings; variable data goes into key=value fields
  appended after the message. All output goes to stderr so command
  output on stdout stays machine readable.

  Level and pattern come from CODEINTEL_LOG_LEVEL / CODEINTEL_LOG_PATTERN,
  then from the logging section of the config.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField CountField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const codeintel::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace codeintel::observability

#define CODEINTEL_LOG(level, message, ...) ::codeintel::observability::Log((level), (message), ##__VA_ARGS__)

#define CODEINTEL_LOG_DEBUG(message, ...) CODEINTEL_LOG(::spdlog::level::debug, message, ##__VA_ARGS__)
#define CODEINTEL_LOG_INFO(message, ...) CODEINTEL_LOG(::spdlog::level::info, message, ##__VA_ARGS__)
#define CODEINTEL_LOG_WARN(message, ...) CODEINTEL_LOG(::spdlog::level::warn, message, ##__VA_ARGS__)
#define CODEINTEL_LOG_ERROR(message, ...) CODEINTEL_LOG(::spdlog::level::err, message, ##__VA_ARGS__)
