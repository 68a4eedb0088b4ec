#pragma once

#include <memory>
#include <string>

namespace shipyard::deploy {
class DeployOrchestrator;
class CompletionDetector;
class DeployLifecycle;
class LogFollower;
} // namespace shipyard::deploy
namespace shipyard::catalog {
class ProjectCatalog;
}
namespace shipyard::allowlist {
class AllowlistStore;
class AllowlistGuard;
} // namespace shipyard::allowlist
namespace shipyard::audit {
class AuditTrail;
}
namespace shipyard::auth {
class PrivilegeGate;
}
namespace shipyard::gateway {
class ExecutionGateway;
}

namespace shipyard::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<shipyard::deploy::DeployOrchestrator>  orchestrator;
  std::shared_ptr<shipyard::deploy::CompletionDetector>  detector;
  std::shared_ptr<shipyard::deploy::DeployLifecycle>     lifecycle;
  std::shared_ptr<shipyard::allowlist::AllowlistStore>   allowlist;
  std::shared_ptr<shipyard::allowlist::AllowlistGuard>   guard;
  std::shared_ptr<shipyard::audit::AuditTrail>           audit;
  std::shared_ptr<shipyard::auth::PrivilegeGate>         privileges;
  std::shared_ptr<shipyard::gateway::ExecutionGateway>   gateway;
  std::shared_ptr<shipyard::catalog::ProjectCatalog>     catalog;
  std::shared_ptr<shipyard::deploy::LogFollower>         follower;
};

// Tokens presented by the caller (gRPC metadata).
struct CallerCredentials {
  std::string session_token;
  std::string internal_token;
};

} // namespace shipyard::service
