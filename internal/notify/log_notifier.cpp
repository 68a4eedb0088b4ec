#include "internal/notify/notifier.hpp"

#include "internal/observability/logging.hpp"

namespace shipyard::notify {

using shipyard::observability::IntField;
using shipyard::observability::OptionalField;
using shipyard::observability::StringField;

void LogNotifier::DeployStarted(const std::string& service_name, const std::string& actor) {
  SHIPYARD_LOG_INFO("deploy started", {StringField("service", service_name), StringField("actor", actor)});
}

void LogNotifier::DeploySucceeded(const std::string& service_name, const std::optional<std::string>& commit_sha,
                                  std::optional<std::uint64_t> duration_ms) {
  SHIPYARD_LOG_INFO("deploy succeeded", {StringField("service", service_name), OptionalField("commit", commit_sha),
                                         IntField("duration_ms", static_cast<std::int64_t>(duration_ms.value_or(0)))});
}

void LogNotifier::DeployFailed(const std::string& service_name, const std::string& error_message) {
  SHIPYARD_LOG_WARN("deploy failed", {StringField("service", service_name), StringField("error", error_message)});
}

} // namespace shipyard::notify
