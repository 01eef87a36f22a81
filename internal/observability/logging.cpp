#include "internal/observability/logging.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace buildq::observability {
namespace {

constexpr const char* kLoggerName = "buildq";

std::atomic<bool> g_include_trace_context{false};

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (unsigned char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || c < 0x20) return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }

  out.push_back('"');
  for (unsigned char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (c < 0x20) {
          out.append(fmt::format("\\x{:02x}", c));
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

bool ParseFlag(std::string_view raw) {
  return raw == "1" || raw == "true" || raw == "yes";
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string HexId(const std::array<uint8_t, N>& bytes) {
  std::string out;
  out.reserve(N * 2);
  for (auto b : bytes) out.append(fmt::format("{:02x}", b));
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  std::array<uint8_t, 16> trace_bytes{};
  std::array<uint8_t, 8>  span_bytes{};
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line.append(" trace_id=").append(HexId(trace_bytes));
  line.append(" span_id=").append(HexId(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), fmt::format("{}ms", value.count())};
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
  std::string lowered;
  lowered.reserve(name.size());
  for (unsigned char c : name) lowered.push_back(static_cast<char>(std::tolower(c)));

  // spdlog::level::from_str maps unknown names to "off", which would silently
  // disable logging on a typo.
  static const std::array<std::pair<std::string_view, spdlog::level::level_enum>, 9> kLevels{{
      {"trace", spdlog::level::trace},
      {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},
      {"warning", spdlog::level::warn},
      {"error", spdlog::level::err},
      {"err", spdlog::level::err},
      {"critical", spdlog::level::critical},
      {"off", spdlog::level::off},
  }};
  for (const auto& [level_name, level] : kLevels) {
    if (lowered == level_name) return level;
  }
  throw std::invalid_argument("unknown log level: " + std::string(name));
}

LogSettings ResolveLogSettings(const buildq::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  if (!logging.level().empty()) settings.level = ParseLogLevel(logging.level());
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  settings.include_trace_context = logging.include_trace_context();

  if (const char* level = std::getenv("BUILDQ_LOG_LEVEL"); level && *level) {
    settings.level = ParseLogLevel(level);
  }
  if (const char* pattern = std::getenv("BUILDQ_LOG_PATTERN"); pattern && *pattern) {
    settings.pattern = pattern;
  }
  if (const char* include_trace = std::getenv("BUILDQ_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = ParseFlag(include_trace);
  }
  return settings;
}

void InitializeLogging(const LogSettings& settings) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context.store(settings.include_trace_context, std::memory_order_relaxed);
}

void InitializeLogging(const buildq::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLogSettings(config));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key).push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace buildq::observability
