#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace cacheq::observability {
namespace {

constexpr const char* kLoggerName     = "cacheq";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

// env var, then config, then fallback
std::string Pick(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* env = std::getenv(env_name); env != nullptr && *env != '\0') {
    return env;
  }
  return configured.empty() ? fallback : configured;
}

// spdlog maps unknown names to "off"; only an explicit "off" may silence the logger.
bool ParseLevel(const std::string& name, spdlog::level::level_enum* level) {
  *level = spdlog::level::from_str(name);
  return *level != spdlog::level::off || name == "off";
}

bool NeedsQuotes(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(std::string& out, const LogField& field) {
  out += field.key;
  out += '=';
  if (!NeedsQuotes(field.value)) {
    out += field.value;
    return;
  }

  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
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

void InitializeLogging(const cacheq::runtime::config::RuntimeConfig& config) {
  const auto level_name = Pick("CACHEQ_LOG_LEVEL", config.logging().level(), "info");

  spdlog::level::level_enum level = spdlog::level::info;
  const bool                known = ParseLevel(level_name, &level);
  if (!known) {
    level = spdlog::level::info;
  }

  // replace any logger left by an earlier initialization
  spdlog::drop(kLoggerName);

  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Pick("CACHEQ_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  if (!known) {
    LogWarn("unknown log level; using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger();
  if (!logger || !logger->should_log(level)) {
    return;
  }

  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    AppendField(line, field);
  }
  logger->log(level, "{}", line);
}

} // namespace cacheq::observability
