#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cacheq::runtime::config {
class RuntimeConfig;
}

namespace cacheq::observability {

/*
  Structured logging on top of spdlog.

  Every line is the message followed by key=value pairs; values holding
  spaces, quotes or '=' are quoted. Until InitializeLogging() runs, lines
  go to spdlog's default logger.

  Level and pattern come from CACHEQ_LOG_LEVEL / CACHEQ_LOG_PATTERN, then
  the logging section of the config.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const cacheq::runtime::config::RuntimeConfig& config);

// Flushes and drops every logger; backends must be destroyed first.
void ShutdownLogging();

// Fields are only serialized when the level is enabled.
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

} // namespace cacheq::observability

#define CACHEQ_LOG_DEBUG(message, ...) ::cacheq::observability::LogDebug((message), ##__VA_ARGS__)
#define CACHEQ_LOG_INFO(message, ...) ::cacheq::observability::LogInfo((message), ##__VA_ARGS__)
#define CACHEQ_LOG_WARN(message, ...) ::cacheq::observability::LogWarn((message), ##__VA_ARGS__)
#define CACHEQ_LOG_ERROR(message, ...) ::cacheq::observability::LogError((message), ##__VA_ARGS__)
