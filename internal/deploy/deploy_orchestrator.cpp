#include "deploy_orchestrator.hpp"

#include <algorithm>
#include <cctype>

#include "internal/allowlist/allowlist_guard.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/command/shell_command.hpp"
#include "internal/deploy/deploy_lifecycle.hpp"
#include "internal/gateway/execution_gateway.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace shipyard::deploy {

using shipyard::allowlist::AllowlistKind;
using shipyard::db::model::AuditOutcome;
using shipyard::model::DeployStatus;
using shipyard::model::DeployStrategy;
using shipyard::observability::StringField;
using shipyard::observability::OptionalField;

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string OutputOf(const gateway::ShellResult& result, const char* fallback = "No output") {
  if (!result.stdout_text.empty()) return result.stdout_text;
  if (!result.stderr_text.empty()) return result.stderr_text;
  return fallback;
}

void AppendSection(std::string& transcript, const std::string& title, const std::string& body) {
  transcript += "=== " + title + " ===\n" + body;
  if (body.empty() || body.back() != '\n') {
    transcript += "\n";
  }
  transcript += "\n";
}

bool LooksLikeCommitSha(const std::string& s) {
  return s.size() == 40 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c); });
}

std::string Join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

} // namespace

DeployOrchestrator::DeployOrchestrator(std::shared_ptr<gateway::ExecutionGateway> gateway, std::shared_ptr<allowlist::AllowlistGuard> guard,
                                       std::shared_ptr<catalog::ProjectCatalog> catalog, std::shared_ptr<DeployLifecycle> lifecycle,
                                       std::shared_ptr<notify::Notifier> notifier, std::shared_ptr<audit::AuditTrail> audit,
                                       OrchestratorOptions options)
    : gateway_(std::move(gateway)),
      guard_(std::move(guard)),
      catalog_(std::move(catalog)),
      lifecycle_(std::move(lifecycle)),
      notifier_(std::move(notifier)),
      audit_(std::move(audit)),
      options_(std::move(options)),
      resolver_(gateway_, guard_, options_.projects_dir),
      log_policy_(options_.log_dir) {
}

DeployOrchestrator::Target DeployOrchestrator::ResolveTarget(const DeployRequest& request) const {
  Target target;

  if (!request.service_id.empty()) {
    auto service = catalog_->FindService(request.service_id);
    if (!service) {
      throw util::NotFound("service not found: " + request.service_id);
    }
    auto project = catalog_->FindProject(service->project_id);
    if (!project) {
      throw util::NotFound("project not found: " + service->project_id);
    }
    if (!request.project_id.empty() && request.project_id != project->id) {
      throw util::InvalidArgument("service " + service->id + " does not belong to project " + request.project_id);
    }

    target.project = *project;
    target.linked  = *service;
    target.services.push_back(*service);
    for (auto& other : catalog_->ServicesOf(project->id)) {
      if (other.id != service->id) {
        target.services.push_back(std::move(other));
      }
    }
    return target;
  }

  if (request.project_id.empty()) {
    throw util::InvalidArgument("project_id or service_id is required");
  }

  auto project = catalog_->FindProject(request.project_id);
  if (!project) {
    throw util::NotFound("project not found: " + request.project_id);
  }
  target.project  = *project;
  target.services = catalog_->ServicesOf(project->id);
  target.linked   = catalog::LinkedService(target.services);
  return target;
}

DeployHandle DeployOrchestrator::Deploy(const DeployRequest& request) {
  shipyard::observability::SpanScope span("DeployOrchestrator.Deploy");

  if (request.triggered_by.empty()) {
    throw util::InvalidArgument("triggered_by is required");
  }
  if (request.branch && !request.branch->empty()) {
    command::RequireBranch(*request.branch);
  }

  const auto target = ResolveTarget(request);
  span.SetAttribute("project", target.project.id);

  const auto strategy = target.linked && target.linked->strategy ? *target.linked->strategy : options_.default_strategy;
  if (strategy == DeployStrategy::kManual) {
    throw util::InvalidState("service requires manual deployment");
  }

  SHIPYARD_LOG_INFO("deploy requested", {StringField("project", target.project.id),
                                         StringField("service", target.linked ? target.linked->id : std::string{}),
                                         OptionalField("branch", request.branch), StringField("actor", request.triggered_by)});

  std::string transcript;
  try {
    return Run(request, target, transcript);
  } catch (const util::OperationBlocked&) {
    throw;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    SHIPYARD_LOG_WARN("deploy aborted", {StringField("project", target.project.id), StringField("error", e.what())});
    audit_->Record(request.triggered_by, "deploy.start", "project", target.project.id, AuditOutcome::kFailed, e.what());
    throw;
  }
}

DeployHandle DeployOrchestrator::Run(const DeployRequest& request, const Target& target, std::string& transcript) {
  const auto& actor    = request.triggered_by;
  const auto  strategy = target.linked && target.linked->strategy ? *target.linked->strategy : options_.default_strategy;

  // ------------------------------------------------------------------
  // 1. Path resolution + allowlist
  // ------------------------------------------------------------------
  DeployHandle handle;
  handle.resolved_path = resolver_.Resolve(target.project, target.services, request.custom_path);
  const auto& path     = handle.resolved_path.path;

  guard_->Require(AllowlistKind::kRepoPath, path, actor, "deploy.start");

  std::optional<std::string> compose_project;
  if (target.linked && target.linked->compose_project) {
    command::RequireComposeProject(*target.linked->compose_project);
    guard_->Require(AllowlistKind::kComposeProject, *target.linked->compose_project, actor, "deploy.start");
    compose_project = target.linked->compose_project;
  }

  SHIPYARD_LOG_INFO("deploy path resolved", {StringField("path", path), StringField("source", ToString(handle.resolved_path.source))});

  AppendSection(transcript, "Deployment Info",
                "Project: " + target.project.name + "\nPath: " + path + "\nStrategy: " + std::string(shipyard::model::ToString(strategy)) +
                    "\nMode: Background build\nTriggered by: " + actor + "\n");

  // ------------------------------------------------------------------
  // 2. Compose definition
  // ------------------------------------------------------------------
  AppendSection(transcript, "Directory Contents", OutputOf(gateway_->Execute(command::ListDirectory(path))));

  const auto compose_check = gateway_->Execute(command::ComposeFileExists(path));
  if (compose_check.stdout_text.find("NOT_FOUND") != std::string::npos || compose_check.stdout_text.find("FOUND") == std::string::npos) {
    throw util::ResolutionError("No docker-compose.yml found in " + path);
  }

  // ------------------------------------------------------------------
  // 3. Source update
  // ------------------------------------------------------------------
  const auto fetch = gateway_->Execute(command::GitFetch(path));
  if (!fetch.success) {
    SHIPYARD_LOG_WARN("git fetch reported failure", {StringField("path", path), StringField("output", Trim(OutputOf(fetch)))});
  }
  AppendSection(transcript, "Git Fetch", OutputOf(fetch));

  if (request.branch && !request.branch->empty()) {
    const auto checkout = gateway_->Execute(command::GitCheckout(path, *request.branch));
    AppendSection(transcript, "Git Checkout (" + *request.branch + ")", OutputOf(checkout));
    if (!checkout.success) {
      throw util::CommandFailed("Git checkout failed: " + Trim(OutputOf(checkout)));
    }
  }

  const auto pull = gateway_->Execute(command::GitPull(path));
  AppendSection(transcript, "Git Pull", OutputOf(pull));
  if (!pull.success) {
    throw util::CommandFailed("Git pull failed: " + Trim(OutputOf(pull)));
  }

  std::string commit_sha;
  const auto  head = gateway_->Execute(command::GitRevParseHead(path));
  if (head.success && LooksLikeCommitSha(Trim(head.stdout_text))) {
    commit_sha = Trim(head.stdout_text);
  } else {
    SHIPYARD_LOG_WARN("could not resolve commit", {StringField("path", path), StringField("output", Trim(OutputOf(head, "")))});
  }

  // ------------------------------------------------------------------
  // 4. Topology discovery
  // ------------------------------------------------------------------
  std::vector<std::string> rejected;
  const auto profiles = command::FilterProfiles(gateway_->Execute(command::ComposeProfiles(path, compose_project)).stdout_text, &rejected);
  for (const auto& bad : rejected) {
    SHIPYARD_LOG_WARN("ignoring invalid compose profile", {StringField("path", path), StringField("profile", bad)});
  }
  if (!profiles.empty()) {
    AppendSection(transcript, "Profiles", Join(profiles, ", "));
  }

  const auto services = gateway_->Execute(command::ComposeServices(path, compose_project, profiles));
  AppendSection(transcript, "Available Services", OutputOf(services, "No services found"));

  // ------------------------------------------------------------------
  // 5. Bookkeeping + background launch
  // ------------------------------------------------------------------
  const auto invocation = command::ComposeInvocation(strategy, compose_project, profiles);
  handle.logs_pointer   = log_policy_.Make(target.project.slug, util::NowMillis());
  const auto launch     = command::DetachedLaunch(path, invocation, handle.logs_pointer);

  const auto service_id = target.linked ? std::optional<std::string>(target.linked->id) : std::nullopt;
  auto       record     = lifecycle_->Create(service_id, actor, commit_sha);
  lifecycle_->MarkRunning(record.id, handle.logs_pointer);

  const auto service_name = target.linked ? target.linked->name : target.project.name;

  try {
    const auto started = gateway_->Execute(launch);
    if (!started.success) {
      throw util::CommandFailed("background build failed to start: " + Trim(OutputOf(started)));
    }
  } catch (const std::exception& e) {
    AppendSection(transcript, "Docker Compose", std::string("Failed to start: ") + e.what());
    if (lifecycle_->Complete(record.id, DeployStatus::kFailed, e.what())) {
      notifier_->DeployFailed(service_name, e.what());
    }
    SHIPYARD_LOG_ERROR("background launch failed", {StringField("deploy_id", record.id), StringField("error", e.what())});
    throw;
  }

  AppendSection(transcript, "Docker Compose",
                "Build started in background.\nCommand: " + invocation + "\nLog file: " + handle.logs_pointer + "\n");
  transcript += "The build is running in the background. Poll the deploy status to follow it.\n";

  SHIPYARD_LOG_INFO("background build launched", {StringField("deploy_id", record.id), StringField("path", path),
                                                   StringField("log", handle.logs_pointer), StringField("actor", actor)});

  notifier_->DeployStarted(service_name, actor);
  audit_->Record(actor, "deploy.start", "deploy", record.id, AuditOutcome::kOk,
                 "project=" + target.project.id + " path=" + path + " branch=" + request.branch.value_or("default") +
                     " log=" + handle.logs_pointer);

  handle.record     = lifecycle_->Get(record.id).value_or(record);
  handle.transcript = transcript;
  return handle;
}

} // namespace shipyard::deploy
