#include "completion_detector.hpp"

#include <regex>

#include "internal/catalog/project_catalog.hpp"
#include "internal/command/shell_command.hpp"
#include "internal/deploy/completion_marker.hpp"
#include "internal/deploy/deploy_lifecycle.hpp"
#include "internal/gateway/execution_gateway.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::deploy {

using shipyard::model::DeployStatus;
using shipyard::observability::IntField;
using shipyard::observability::StringField;

CompletionDetector::CompletionDetector(std::shared_ptr<gateway::ExecutionGateway> gateway, std::shared_ptr<DeployLifecycle> lifecycle,
                                       std::shared_ptr<catalog::ProjectCatalog> catalog, std::shared_ptr<notify::Notifier> notifier,
                                       LogPointerPolicy log_policy, LogClassifier classifier, DetectorOptions options)
    : gateway_(std::move(gateway)),
      lifecycle_(std::move(lifecycle)),
      catalog_(std::move(catalog)),
      notifier_(std::move(notifier)),
      log_policy_(std::move(log_policy)),
      classifier_(std::move(classifier)),
      options_(options) {
}

bool CompletionDetector::HasDockerSuccess(const std::string& log) {
  static const std::regex kSignatures[] = {
      std::regex(R"(Container .+ Started)", std::regex::icase),
      std::regex(R"(Container .+ Running)", std::regex::icase),
      std::regex(R"(Creating .+ \.\.\. done)", std::regex::icase),
      std::regex(R"(successfully built)", std::regex::icase),
      std::regex(R"(successfully tagged)", std::regex::icase),
  };

  for (const auto line : BoundedLines(log)) {
    if (line.size() >= 7 && line.substr(line.size() - 7) == "Started") {
      return true;
    }
    for (const auto& re : kSignatures) {
      if (std::regex_search(line.begin(), line.end(), re)) {
        return true;
      }
    }
  }
  return false;
}

bool CompletionDetector::IsStale(const std::string& logs_pointer) const {
  try {
    const auto result = gateway_->Execute(command::LogFreshness(logs_pointer, options_.freshness_window_s));
    return result.stdout_text.find("STALE") != std::string::npos;
  } catch (const util::TransportError& e) {
    // Without a freshness answer the job is treated as still running.
    SHIPYARD_LOG_WARN("staleness check failed", {StringField("log", logs_pointer), StringField("error", e.what())});
    return false;
  }
}

CompletionDetector::Outcome CompletionDetector::Decide(const std::string& log, bool has_marker) const {
  std::optional<int> exit_code;
  if (has_marker) {
    const auto marker = ParseCompletionMarker(log);
    if (marker.success) {
      return {DeployStatus::kSuccess, {}};
    }
    exit_code = marker.exit_code;
  }

  const auto classification = classifier_.Classify(log);

  if (has_marker) {
    std::string reason = classification.has_error ? classification.message : "Docker compose exited with non-zero code";
    if (exit_code) {
      reason += " (exit code: " + std::to_string(*exit_code) + ")";
    }
    return {DeployStatus::kFailed, reason};
  }

  if (classification.has_error) {
    return {DeployStatus::kFailed, classification.message};
  }
  return {DeployStatus::kSuccess, {}};
}

void CompletionDetector::Notify(const db::model::DeployRecord& record) {
  std::string service_name = "Unknown Service";
  if (record.service_id) {
    if (auto service = catalog_->FindService(*record.service_id)) {
      service_name = service->name;
    }
  }

  if (record.status == DeployStatus::kSuccess) {
    std::optional<std::uint64_t> duration_ms;
    if (record.completed_at_ms && *record.completed_at_ms >= record.started_at_ms) {
      duration_ms = *record.completed_at_ms - record.started_at_ms;
    }
    notifier_->DeploySucceeded(service_name, record.commit_sha.empty() ? std::nullopt : std::optional<std::string>(record.commit_sha),
                               duration_ms);
  } else {
    notifier_->DeployFailed(service_name, record.error_message.empty() ? "Unknown error" : record.error_message);
  }
}

StatusReport CompletionDetector::CheckStatus(const std::string& logs_pointer, const std::optional<std::string>& deploy_id) {
  shipyard::observability::SpanScope span("CompletionDetector.CheckStatus");

  log_policy_.Require(logs_pointer);

  std::optional<db::model::DeployRecord> record;
  if (deploy_id && !deploy_id->empty()) {
    record = lifecycle_->Get(*deploy_id);
    if (!record) {
      throw util::NotFound("deploy not found: " + *deploy_id);
    }
    if (record->logs_pointer != logs_pointer) {
      throw util::InvalidArgument("log file does not belong to deploy " + *deploy_id);
    }
  } else {
    record = lifecycle_->FindByLogsPointer(logs_pointer);
  }

  const auto tail = gateway_->Execute(command::TailLog(logs_pointer, options_.tail_lines));

  StatusReport report;
  report.log = !tail.stdout_text.empty() ? tail.stdout_text : (!tail.stderr_text.empty() ? tail.stderr_text : "No log output");

  const bool has_marker = report.log.find(kCompletionMarker) != std::string::npos;
  report.is_complete    = has_marker;
  if (!report.is_complete && HasDockerSuccess(report.log)) {
    report.is_complete = IsStale(logs_pointer);
    if (report.is_complete) {
      SHIPYARD_LOG_INFO("log is stale, assuming completion", {StringField("log", logs_pointer)});
    }
  }

  if (record) {
    report.status = record->status;
  }

  if (!report.is_complete || !record || record->status != DeployStatus::kRunning) {
    return report;
  }

  const auto outcome = Decide(report.log, has_marker);
  auto       applied = lifecycle_->Complete(record->id, outcome.status, outcome.error_message);
  if (!applied) {
    // Someone else recorded the terminal state first.
    if (auto current = lifecycle_->Get(record->id)) {
      report.status = current->status;
    }
    return report;
  }

  report.status       = applied->status;
  report.transitioned = true;
  span.SetAttribute("deploy_id", applied->id);
  Notify(*applied);
  return report;
}

RefreshSummary CompletionDetector::RefreshRunningDeploys() {
  db::model::DeployFilter filter;
  filter.status = DeployStatus::kRunning;
  filter.limit  = 0;

  RefreshSummary summary;
  for (const auto& record : lifecycle_->List(filter)) {
    if (record.logs_pointer.empty()) {
      continue;
    }
    ++summary.checked;
    try {
      if (CheckStatus(record.logs_pointer, record.id).transitioned) {
        ++summary.completed;
      }
    } catch (const std::exception& e) {
      SHIPYARD_LOG_WARN("status refresh failed", {StringField("deploy_id", record.id), StringField("error", e.what())});
    }
  }

  SHIPYARD_LOG_DEBUG("running deploys refreshed",
                     {IntField("checked", summary.checked), IntField("completed", summary.completed)});
  return summary;
}

} // namespace shipyard::deploy
