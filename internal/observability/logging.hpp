#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace modelplan::runtime::config {
class LoggingConfig;
}

namespace modelplan::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Renders fields as they appear after the message: key=value, with values
// containing blanks, quotes or '=' double-quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// Level, pattern and sink come from MODELPLAN_LOG_* first, then config.
// Throws util::InvalidArgument for an unknown level name.
void InitializeLogging(const modelplan::runtime::config::LoggingConfig& config);
void ShutdownLogging();

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

} // namespace modelplan::observability

#define MODELPLAN_LOG_DEBUG(message, ...) ::modelplan::observability::LogDebug((message), ##__VA_ARGS__)
#define MODELPLAN_LOG_INFO(message, ...) ::modelplan::observability::LogInfo((message), ##__VA_ARGS__)
#define MODELPLAN_LOG_WARN(message, ...) ::modelplan::observability::LogWarn((message), ##__VA_ARGS__)
#define MODELPLAN_LOG_ERROR(message, ...) ::modelplan::observability::LogError((message), ##__VA_ARGS__)
