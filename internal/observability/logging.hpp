#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace buildq::runtime::config {
class RuntimeConfig;
}

namespace buildq::observability {

/*
  Structured logging on top of spdlog.

  Every line is "<message> key=value key=value", logfmt style. Values that
  would break tokenizing (spaces, quotes, '=', control characters, empty)
  are double-quoted with backslash escapes.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
  bool                      include_trace_context{false};
};

// Case-insensitive. Accepts "warning" and "err" as aliases.
// Throws std::invalid_argument for anything else.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

// File settings, overridden by BUILDQ_LOG_LEVEL, BUILDQ_LOG_PATTERN and
// BUILDQ_LOG_INCLUDE_TRACE_CONTEXT when set.
LogSettings ResolveLogSettings(const buildq::runtime::config::RuntimeConfig& config);

// Safe to call more than once; the previous "buildq" logger is replaced.
void InitializeLogging(const LogSettings& settings);
void InitializeLogging(const buildq::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace buildq::observability

#define BUILDQ_LOG_DEBUG(message, ...) ::buildq::observability::LogDebug((message), ##__VA_ARGS__)
#define BUILDQ_LOG_INFO(message, ...) ::buildq::observability::LogInfo((message), ##__VA_ARGS__)
#define BUILDQ_LOG_WARN(message, ...) ::buildq::observability::LogWarn((message), ##__VA_ARGS__)
#define BUILDQ_LOG_ERROR(message, ...) ::buildq::observability::LogError((message), ##__VA_ARGS__)
