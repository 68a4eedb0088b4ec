#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace shipyard::observability {
namespace {

std::string ResolveLevel(const shipyard::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("SHIPYARD_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const shipyard::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("SHIPYARD_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

// Values with spaces are quoted so a line stays splittable on ' '.
std::string QuoteIfNeeded(const std::string& value) {
  if (value.find_first_of(" \t\n\"") == std::string::npos) {
    return value;
  }
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << QuoteIfNeeded(field.value);
  }
  return out.str();
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

LogField OptionalField(std::string_view key, const std::optional<std::string>& value) {
  return {std::string(key), value && !value->empty() ? *value : "-"};
}

LogField DurationMsField(std::string_view key, double milliseconds) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(1);
  out << milliseconds;
  return {std::string(key), out.str()};
}

void InitializeLogging(const shipyard::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("shipyard");
  if (!logger) {
    logger = spdlog::stdout_color_mt("shipyard");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace shipyard::observability
