#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/model/deploy_record.hpp"
#include "internal/deploy/log_classifier.hpp"
#include "internal/deploy/log_pointer.hpp"

namespace shipyard::gateway {
class ExecutionGateway;
}
namespace shipyard::catalog {
class ProjectCatalog;
}
namespace shipyard::notify {
class Notifier;
}

namespace shipyard::deploy {

class DeployLifecycle;

struct DetectorOptions {
  std::uint32_t tail_lines         = 300;
  std::uint32_t freshness_window_s = 30;
};

struct StatusReport {
  std::string log;
  bool        is_complete = false;

  // Record state after this check, when a record is associated.
  std::optional<shipyard::model::DeployStatus> status;

  // True only for the call that applied the terminal transition.
  bool transitioned = false;
};

struct RefreshSummary {
  std::uint32_t checked   = 0;
  std::uint32_t completed = 0;
};

/*
  Decides from a background job's log whether it is still running.

  Completion evidence, strongest first:
    1. the completion marker; its STATUS line decides success
    2. a docker success signature plus a log file that has not been
       written for the freshness window (jobs without the marker).
       This is an approximation: a paused build can look finished.

  Unrecognized output means "still running", never an error. The raw log
  is always returned. The terminal write is conditional on the record
  still being running, so only one caller notifies.
*/
class CompletionDetector {
 public:
  CompletionDetector(std::shared_ptr<gateway::ExecutionGateway> gateway, std::shared_ptr<DeployLifecycle> lifecycle,
                     std::shared_ptr<catalog::ProjectCatalog> catalog, std::shared_ptr<notify::Notifier> notifier,
                     LogPointerPolicy log_policy, LogClassifier classifier, DetectorOptions options);

  StatusReport CheckStatus(const std::string& logs_pointer, const std::optional<std::string>& deploy_id);

  // Runs CheckStatus for every running record with a log pointer.
  RefreshSummary RefreshRunningDeploys();

  // Docker/compose output that suggests the job finished without a marker.
  static bool HasDockerSuccess(const std::string& log);

 private:
  struct Outcome {
    shipyard::model::DeployStatus status;
    std::string                   error_message;
  };

  Outcome Decide(const std::string& log, bool has_marker) const;
  bool    IsStale(const std::string& logs_pointer) const;
  void    Notify(const db::model::DeployRecord& record);

  std::shared_ptr<gateway::ExecutionGateway> gateway_;
  std::shared_ptr<DeployLifecycle>           lifecycle_;
  std::shared_ptr<catalog::ProjectCatalog>   catalog_;
  std::shared_ptr<notify::Notifier>          notifier_;
  LogPointerPolicy                           log_policy_;
  LogClassifier                              classifier_;
  DetectorOptions                            options_;
};

} // namespace shipyard::deploy
