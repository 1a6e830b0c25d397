#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace routebid::runtime::config {
class RuntimeConfig;
}

namespace routebid::observability {

/*
  Structured logging over spdlog.

  Each line is the message followed by key=value fields. Values carrying
  spaces, quotes or '=' (addresses, error text, bid messages) are quoted so
  a line splits back into the same fields. With trace context enabled and
  an OpenTelemetry span active, trace_id and span_id are appended.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Renders fields as they appear in a log line.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const routebid::runtime::config::RuntimeConfig& config);
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

} // namespace routebid::observability

#define ROUTEBID_LOG_DEBUG(message, ...) ::routebid::observability::LogDebug((message), ##__VA_ARGS__)
#define ROUTEBID_LOG_INFO(message, ...) ::routebid::observability::LogInfo((message), ##__VA_ARGS__)
#define ROUTEBID_LOG_WARN(message, ...) ::routebid::observability::LogWarn((message), ##__VA_ARGS__)
#define ROUTEBID_LOG_ERROR(message, ...) ::routebid::observability::LogError((message), ##__VA_ARGS__)
