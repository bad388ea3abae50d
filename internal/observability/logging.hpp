#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace codegraph::runtime::config {
class RuntimeConfig;
}

namespace codegraph::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Safe to call more than once; a second call replaces the logger.
void InitializeLogging(const codegraph::runtime::config::RuntimeConfig& config);
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

} // namespace codegraph::observability

#define CODEGRAPH_LOG_DEBUG(message, ...) ::codegraph::observability::LogDebug((message), ##__VA_ARGS__)
#define CODEGRAPH_LOG_INFO(message, ...) ::codegraph::observability::LogInfo((message), ##__VA_ARGS__)
#define CODEGRAPH_LOG_WARN(message, ...) ::codegraph::observability::LogWarn((message), ##__VA_ARGS__)
#define CODEGRAPH_LOG_ERROR(message, ...) ::codegraph::observability::LogError((message), ##__VA_ARGS__)
