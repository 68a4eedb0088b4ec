#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/project_catalog.hpp"
#include "internal/db/model/deploy_record.hpp"
#include "internal/deploy/log_pointer.hpp"
#include "internal/deploy/path_resolver.hpp"

namespace shipyard::gateway {
class ExecutionGateway;
}
namespace shipyard::allowlist {
class AllowlistGuard;
}
namespace shipyard::audit {
class AuditTrail;
}
namespace shipyard::notify {
class Notifier;
}

namespace shipyard::deploy {

class DeployLifecycle;

struct DeployRequest {
  // One of project_id / service_id. A service id selects its project.
  std::string                project_id;
  std::string                service_id;
  std::optional<std::string> custom_path;
  std::optional<std::string> branch;
  std::string                triggered_by;
};

struct DeployHandle {
  std::string             transcript;
  ResolvedPath            resolved_path;
  std::string             logs_pointer;
  db::model::DeployRecord record;
};

struct OrchestratorOptions {
  std::string                    projects_dir = "/home/pi/projects";
  std::string                    log_dir      = "/tmp";
  shipyard::model::DeployStrategy default_strategy = shipyard::model::DeployStrategy::kPullRebuild;
};

/*
  Drives one deployment up to the point where the build runs on its own.

    resolve path -> allowlist -> compose file check -> fetch/checkout/pull
    -> discover profiles/services -> record (running) -> detached launch

  Returns as soon as the background job is spawned. Failures before the
  launch throw and leave no deploy record behind; a failed launch marks
  the record failed before rethrowing.
*/
class DeployOrchestrator {
 public:
  DeployOrchestrator(std::shared_ptr<gateway::ExecutionGateway> gateway, std::shared_ptr<allowlist::AllowlistGuard> guard,
                     std::shared_ptr<catalog::ProjectCatalog> catalog, std::shared_ptr<DeployLifecycle> lifecycle,
                     std::shared_ptr<notify::Notifier> notifier, std::shared_ptr<audit::AuditTrail> audit, OrchestratorOptions options);

  DeployHandle Deploy(const DeployRequest& request);

 private:
  struct Target {
    catalog::Project                project;
    std::vector<catalog::Service>   services; // linked service first
    std::optional<catalog::Service> linked;
  };

  Target ResolveTarget(const DeployRequest& request) const;

  DeployHandle Run(const DeployRequest& request, const Target& target, std::string& transcript);

  std::shared_ptr<gateway::ExecutionGateway> gateway_;
  std::shared_ptr<allowlist::AllowlistGuard> guard_;
  std::shared_ptr<catalog::ProjectCatalog>   catalog_;
  std::shared_ptr<DeployLifecycle>           lifecycle_;
  std::shared_ptr<notify::Notifier>          notifier_;
  std::shared_ptr<audit::AuditTrail>         audit_;
  OrchestratorOptions                        options_;
  PathResolver                               resolver_;
  LogPointerPolicy                           log_policy_;
};

} // namespace shipyard::deploy
