#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace baton::observability {
namespace {

constexpr char kLoggerName[]     = "baton";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment wins over the config file, which wins over the default.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c == '\n' ? ' ' : c);
  }
  out.push_back('"');
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
  const std::string text(name);
  const auto        level = spdlog::level::from_str(text);
  // from_str maps anything unrecognised to off.
  if (level == spdlog::level::off && text != "off") {
    throw std::invalid_argument("unknown log level: " + text);
  }
  return level;
}

std::string FormatFields(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  for (const auto& field : fields) {
    out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const baton::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLogLevel(Resolve("BATON_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = Resolve("BATON_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;
  spdlog::log(level, "{}", FormatFields(message, fields));
}

} // namespace baton::observability
