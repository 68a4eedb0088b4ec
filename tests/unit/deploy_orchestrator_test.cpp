#include "internal/deploy/deploy_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/deploy/path_resolver.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using shipyard::db::model::AuditOutcome;
using shipyard::deploy::DeployOrchestrator;
using shipyard::deploy::DeployRequest;
using shipyard::deploy::OrchestratorOptions;
using shipyard::deploy::PathSource;
using shipyard::model::DeployStatus;
using shipyard::testing::CatalogConfig;
using shipyard::testing::Harness;

const std::string kSha = "89abcdef0123456789abcdef0123456789abcdef";

DeployOrchestrator MakeOrchestrator(Harness& h) {
  return DeployOrchestrator(h.gateway, h.guard, h.catalog, h.lifecycle, h.notifier, h.audit, OrchestratorOptions{});
}

void ScriptHealthyHost(Harness& h) {
  h.gateway->On("test -d", "EXISTS\n");
  h.gateway->On("test -f", "FOUND\n");
  h.gateway->On("git fetch", "Fetching origin\n");
  h.gateway->On("git pull", "Already up to date.\n");
  h.gateway->On("git rev-parse HEAD", kSha + "\n");
  h.gateway->On("config --profiles", "web\n");
  h.gateway->On("config --services", "web\nworker\n");
}

DeployRequest ProjectRequest() {
  DeployRequest request;
  request.project_id   = "p-web";
  request.triggered_by = "alice";
  return request;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestDeployLaunchesBackgroundBuild() {
  Harness h;
  ScriptHealthyHost(h);
  auto orchestrator = MakeOrchestrator(h);

  const auto handle = orchestrator.Deploy(ProjectRequest());

  assert(handle.resolved_path.path == "/home/pi/projects/web-app");
  assert(handle.resolved_path.source == PathSource::kConvention);
  assert(handle.record.status == DeployStatus::kRunning);
  assert(handle.record.service_id == std::string("svc-web"));
  assert(handle.record.commit_sha == kSha);
  assert(handle.record.triggered_by == "alice");
  assert(handle.record.logs_pointer == handle.logs_pointer);
  assert(handle.logs_pointer.rfind("/tmp/deploy-web-app-", 0) == 0);

  assert(!handle.transcript.empty());
  assert(handle.transcript.find("=== Deployment Info ===") != std::string::npos);
  assert(handle.transcript.find("Already up to date.") != std::string::npos);
  assert(handle.transcript.find("Build started in background.") != std::string::npos);

  assert(h.gateway->Count("nohup") == 1);
  assert(h.gateway->Saw("docker compose -p webapp --profile web up -d --build"));

  assert(h.notifier->started == 1);
  assert(h.notifier->last_service == "web");

  const auto events = h.audit->Recent(10);
  assert(events.size() == 1);
  assert(events[0].action == "deploy.start");
  assert(events[0].outcome == AuditOutcome::kOk);
  assert(events[0].entity_id == handle.record.id);
}

void TestExplicitPathWinsOverServicePath() {
  Harness h(CatalogConfig("/srv/web"));
  ScriptHealthyHost(h);
  auto orchestrator = MakeOrchestrator(h);

  auto request        = ProjectRequest();
  request.custom_path = "/home/pi/projects/web-app";
  const auto custom   = orchestrator.Deploy(request);
  assert(custom.resolved_path.path == "/home/pi/projects/web-app");
  assert(custom.resolved_path.source == PathSource::kCustom);

  const auto linked = orchestrator.Deploy(ProjectRequest());
  assert(linked.resolved_path.path == "/srv/web");
  assert(linked.resolved_path.source == PathSource::kService);

  // Neither explicit nor service paths are checked on the host.
  assert(!h.gateway->Saw("test -d"));
}

void TestUnlistedPathIsBlockedBeforeGateway() {
  Harness h;
  ScriptHealthyHost(h);
  auto orchestrator = MakeOrchestrator(h);

  auto request        = ProjectRequest();
  request.custom_path = "/opt/other";

  assert(Throws<shipyard::util::OperationBlocked>([&] { orchestrator.Deploy(request); }));
  assert(h.gateway->commands.empty());
  assert(h.lifecycle->List({}).empty());
  assert(h.notifier->started == 0);

  const auto events = h.audit->Recent(10);
  assert(events.size() == 1);
  assert(events[0].outcome == AuditOutcome::kBlocked);
  assert(events[0].entity_id == "/opt/other");
}

void TestUnlistedComposeProjectIsBlocked() {
  Harness h(CatalogConfig("/srv/web"));
  ScriptHealthyHost(h);

  shipyard::v1::Allowlist paths_only;
  paths_only.add_repo_paths("/srv/web");
  h.store->Replace(paths_only);

  auto orchestrator = MakeOrchestrator(h);
  assert(Throws<shipyard::util::OperationBlocked>([&] { orchestrator.Deploy(ProjectRequest()); }));
  assert(h.gateway->commands.empty());
}

void TestHostileProfilesAreDropped() {
  Harness h;
  ScriptHealthyHost(h);
  h.gateway->On("config --profiles", "web\n$(reboot)\nbad profile\n");
  auto orchestrator = MakeOrchestrator(h);

  orchestrator.Deploy(ProjectRequest());

  for (const auto& command : h.gateway->commands) {
    assert(command.find("reboot") == std::string::npos);
    assert(command.find("bad profile") == std::string::npos);
  }
  assert(h.gateway->Saw("--profile web up -d --build"));
}

void TestManualStrategyIsRejected() {
  Harness h(CatalogConfig("/srv/web", "manual"));
  ScriptHealthyHost(h);
  auto orchestrator = MakeOrchestrator(h);

  assert(Throws<shipyard::util::InvalidState>([&] { orchestrator.Deploy(ProjectRequest()); }));
  assert(h.gateway->commands.empty());
}

void TestMissingComposeFileLeavesNoRecord() {
  Harness h;
  ScriptHealthyHost(h);
  h.gateway->On("test -f", "NOT_FOUND\n");
  auto orchestrator = MakeOrchestrator(h);

  assert(Throws<shipyard::util::ResolutionError>([&] { orchestrator.Deploy(ProjectRequest()); }));
  assert(!h.gateway->Saw("git pull"));
  assert(h.lifecycle->List({}).empty());

  const auto events = h.audit->Recent(10);
  assert(events.size() == 1);
  assert(events[0].outcome == AuditOutcome::kFailed);
}

void TestNoCandidateDirectory() {
  Harness h;
  ScriptHealthyHost(h);
  h.gateway->On("test -d", "NOT_FOUND\n");
  auto orchestrator = MakeOrchestrator(h);

  assert(Throws<shipyard::util::ResolutionError>([&] { orchestrator.Deploy(ProjectRequest()); }));
  assert(!h.gateway->Saw("test -f"));
}

void TestPullFailureStopsDeploy() {
  Harness h;
  ScriptHealthyHost(h);
  h.gateway->On("git pull", "CONFLICT (content): Merge conflict in app.js\n", false);
  auto orchestrator = MakeOrchestrator(h);

  assert(Throws<shipyard::util::CommandFailed>([&] { orchestrator.Deploy(ProjectRequest()); }));
  assert(!h.gateway->Saw("nohup"));
  assert(h.lifecycle->List({}).empty());
}

void TestLaunchFailureMarksRecordFailed() {
  Harness h;
  ScriptHealthyHost(h);
  h.gateway->On("nohup", "bash: docker: command not found\n", false);
  auto orchestrator = MakeOrchestrator(h);

  assert(Throws<shipyard::util::CommandFailed>([&] { orchestrator.Deploy(ProjectRequest()); }));

  const auto records = h.lifecycle->List({});
  assert(records.size() == 1);
  assert(records[0].status == DeployStatus::kFailed);
  assert(records[0].error_message.find("failed to start") != std::string::npos);
  assert(h.notifier->failed == 1);
  assert(h.notifier->started == 0);
}

void TestServiceDeploySelectsItsProject() {
  Harness h(CatalogConfig("/srv/web"));
  ScriptHealthyHost(h);
  auto orchestrator = MakeOrchestrator(h);

  DeployRequest request;
  request.service_id   = "svc-web";
  request.branch       = "release/1.2";
  request.triggered_by = "webhook:github";

  const auto handle = orchestrator.Deploy(request);
  assert(handle.record.triggered_by == "webhook:github");
  assert(h.gateway->Saw("git checkout release/1.2"));

  request.branch = "main; reboot";
  assert(Throws<shipyard::util::InvalidArgument>([&] { orchestrator.Deploy(request); }));

  request.branch     = std::nullopt;
  request.service_id = "missing";
  assert(Throws<shipyard::util::NotFound>([&] { orchestrator.Deploy(request); }));
}

} // namespace

int main() {
  TestDeployLaunchesBackgroundBuild();
  TestExplicitPathWinsOverServicePath();
  TestUnlistedPathIsBlockedBeforeGateway();
  TestUnlistedComposeProjectIsBlocked();
  TestHostileProfilesAreDropped();
  TestManualStrategyIsRejected();
  TestMissingComposeFileLeavesNoRecord();
  TestNoCandidateDirectory();
  TestPullFailureStopsDeploy();
  TestLaunchFailureMarksRecordFailed();
  TestServiceDeploySelectsItsProject();

  std::cout << "shipyard_unit_deploy_orchestrator: pass\n";
  return 0;
}
