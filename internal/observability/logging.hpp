#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace shipyard::runtime::config {
class RuntimeConfig;
}

namespace shipyard::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Renders as "-" when absent (deploys without a catalog service, default branch).
LogField OptionalField(std::string_view key, const std::optional<std::string>& value);

// Milliseconds with one decimal.
LogField DurationMsField(std::string_view key, double milliseconds);

void InitializeLogging(const shipyard::runtime::config::RuntimeConfig& config);
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

} // namespace shipyard::observability

#define SHIPYARD_LOG_DEBUG(message, ...) ::shipyard::observability::LogDebug((message), ##__VA_ARGS__)
#define SHIPYARD_LOG_INFO(message, ...) ::shipyard::observability::LogInfo((message), ##__VA_ARGS__)
#define SHIPYARD_LOG_WARN(message, ...) ::shipyard::observability::LogWarn((message), ##__VA_ARGS__)
#define SHIPYARD_LOG_ERROR(message, ...) ::shipyard::observability::LogError((message), ##__VA_ARGS__)
