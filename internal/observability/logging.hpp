#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace workbundle::runtime::config {
class LoggingConfig;
}

namespace workbundle::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// The two fields every bundle log line carries.
inline LogField BundleField(std::string_view name) {
  return StringField("bundle", name);
}

inline LogField LocationField(std::string_view target_location) {
  return StringField("location", target_location);
}

void InitializeLogging(const workbundle::runtime::config::LoggingConfig& config, std::string_view logger_name = "workbundle");
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

} // namespace workbundle::observability

#define WORKBUNDLE_LOG_DEBUG(message, ...) ::workbundle::observability::LogDebug((message), ##__VA_ARGS__)
#define WORKBUNDLE_LOG_INFO(message, ...) ::workbundle::observability::LogInfo((message), ##__VA_ARGS__)
#define WORKBUNDLE_LOG_WARN(message, ...) ::workbundle::observability::LogWarn((message), ##__VA_ARGS__)
#define WORKBUNDLE_LOG_ERROR(message, ...) ::workbundle::observability::LogError((message), ##__VA_ARGS__)
