#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace workbundle::observability {
namespace {

constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment beats config beats the built-in default.
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line.append(field.key).push_back('=');
  // quoted so a space in the value does not split the key=value stream
  if (field.value.find(' ') != std::string::npos) {
    line.append("\"").append(field.value).append("\"");
  } else {
    line.append(field.value);
  }
}

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

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const workbundle::runtime::config::LoggingConfig& config, std::string_view logger_name) {
  // stderr keeps CLI stdout clean for command output
  auto logger = spdlog::get(std::string(logger_name));
  if (!logger) {
    logger = spdlog::stderr_color_mt(std::string(logger_name));
  }
  logger->set_pattern(Setting("WORKBUNDLE_LOG_PATTERN", config.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("WORKBUNDLE_LOG_LEVEL", config.level(), kDefaultLevel)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  spdlog::log(level, "{}", line);
}

} // namespace workbundle::observability
