#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace baton::runtime::config {
class RuntimeConfig;
}

namespace baton::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Throws std::invalid_argument for names spdlog does not know ("warn", "err", ... are fine).
spdlog::level::level_enum ParseLogLevel(std::string_view name);

// Rendered as `message key=value ...`; values with spaces, quotes or '=' are double-quoted.
std::string FormatFields(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const baton::runtime::config::RuntimeConfig& config);
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

} // namespace baton::observability

#define BATON_LOG_DEBUG(message, ...) ::baton::observability::LogDebug((message), ##__VA_ARGS__)
#define BATON_LOG_INFO(message, ...) ::baton::observability::LogInfo((message), ##__VA_ARGS__)
#define BATON_LOG_WARN(message, ...) ::baton::observability::LogWarn((message), ##__VA_ARGS__)
#define BATON_LOG_ERROR(message, ...) ::baton::observability::LogError((message), ##__VA_ARGS__)
