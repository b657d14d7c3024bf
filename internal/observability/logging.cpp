#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace modelplan::observability {
namespace {

constexpr const char* kLoggerName     = "modelplan";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment first, then config, then the fallback.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps every unknown name to "off"
  if (level == spdlog::level::off && name != "off") {
    throw util::InvalidArgument("unknown log level '" + name + "'");
  }
  return level;
}

bool ResolveTraceContextEnabled(const modelplan::runtime::config::LoggingConfig& config) {
  if (const char* include_trace = std::getenv("MODELPLAN_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.include_trace_context();
}

/*
  Plans are usually written to stdout, so the default sink is stderr.
  Anything other than "stdout" or "stderr" is a file path, appended to.
*/
std::shared_ptr<spdlog::logger> CreateLogger(const std::string& sink) {
  if (sink == "stdout") {
    return spdlog::stdout_color_mt(kLoggerName);
  }
  if (sink == "stderr") {
    return spdlog::stderr_color_mt(kLoggerName);
  }
  return spdlog::basic_logger_mt(kLoggerName, sink);
}

// Reasons and summaries contain spaces; quote them so lines stay splittable.
bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendValue(std::ostringstream& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out << '\\';
    }
    out << c;
  }
  out << '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

void InitializeLogging(const modelplan::runtime::config::LoggingConfig& config) {
  const auto level   = ParseLevel(Resolve("MODELPLAN_LOG_LEVEL", config.level(), "info"));
  const auto pattern = Resolve("MODELPLAN_LOG_PATTERN", config.pattern(), kDefaultPattern);
  const auto sink    = Resolve("MODELPLAN_LOG_SINK", config.sink(), "stderr");

  // Reinitialising may switch sinks, so the old logger is replaced.
  spdlog::drop(kLoggerName);
  auto logger = CreateLogger(sink);
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  auto serialized_fields = FormatFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!serialized_fields.empty() && !trace_fields.empty()) {
    spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
    return;
  }
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  if (!trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace modelplan::observability
