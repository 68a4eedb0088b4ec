#include "deploy_service.hpp"

#include <algorithm>

#include "internal/auth/privilege_gate.hpp"
#include "internal/catalog/project_catalog.hpp"
#include "internal/deploy/completion_detector.hpp"
#include "internal/deploy/deploy_lifecycle.hpp"
#include "internal/deploy/deploy_orchestrator.hpp"
#include "internal/deploy/log_follower.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/rpc_support.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::service {

using namespace shipyard::v1;

namespace {

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

constexpr uint32_t kMaxListLimit = 500;

bool DeploysInBulk(const catalog::Service& service) {
  return service.type == "docker" && service.strategy && *service.strategy != model::DeployStrategy::kManual &&
         !service.repo_path.empty();
}

} // namespace

DeployService::DeployService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DeployResponse DeployService::RunDeploy(const DeployRequest& req, const std::string& actor) {
  shipyard::deploy::DeployRequest request;
  request.project_id   = req.project_id();
  request.service_id   = req.service_id();
  request.custom_path  = NonEmpty(req.custom_path());
  request.branch       = NonEmpty(req.branch());
  request.triggered_by = actor;

  const auto handle = ctx_.orchestrator->Deploy(request);

  DeployResponse resp;
  resp.set_transcript(handle.transcript);
  resp.set_resolved_path(handle.resolved_path.path);
  resp.set_deploy_id(handle.record.id);
  resp.set_logs_pointer(handle.logs_pointer);
  *resp.mutable_record() = ToProto(handle.record);
  return resp;
}

DeployResponse DeployService::Deploy(const DeployRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.Deploy", [&] { return RunDeploy(req, RequireSession(ctx_, credentials)); });
}

DeployResponse DeployService::SystemDeploy(const SystemDeployRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.SystemDeploy", [&] {
    if (!ctx_.privileges->VerifyInternal(credentials.internal_token)) {
      throw util::PermissionDenied("internal token required");
    }
    if (req.triggered_by().empty()) {
      throw util::InvalidArgument("triggered_by is required for system deploys");
    }
    return RunDeploy(req.deploy(), req.triggered_by());
  });
}

DeployAllResponse DeployService::DeployAll(const DeployAllRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.DeployAll", [&] {
    const auto actor = RequireSession(ctx_, credentials);

    DeployAllResponse resp;
    for (const auto& service : ctx_.catalog->AllServices()) {
      if (!DeploysInBulk(service)) {
        continue;
      }

      DeployRequest single;
      single.set_service_id(service.id);
      single.set_branch(req.branch());

      auto* result = resp.add_results();
      result->set_service_id(service.id);
      try {
        const auto deployed = RunDeploy(single, actor);
        result->set_success(true);
        result->set_deploy_id(deployed.deploy_id());
        result->set_logs_pointer(deployed.logs_pointer());
        resp.set_deployed(resp.deployed() + 1);
      } catch (const std::exception& e) {
        SHIPYARD_LOG_WARN("bulk deploy skipped service",
                          {observability::StringField("service_id", service.id), observability::StringField("error", e.what())});
        result->set_error(e.what());
        resp.set_failed(resp.failed() + 1);
      }
    }
    resp.set_total(static_cast<uint32_t>(resp.results_size()));

    SHIPYARD_LOG_INFO("bulk deploy finished", {observability::StringField("actor", actor), observability::IntField("deployed", resp.deployed()),
                                               observability::IntField("failed", resp.failed())});
    return resp;
  });
}

CheckStatusResponse DeployService::CheckStatus(const CheckStatusRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.CheckStatus", [&] {
    RequireAnyCaller(ctx_, credentials);

    const auto report = ctx_.detector->CheckStatus(req.logs_pointer(), NonEmpty(req.deploy_id()));

    CheckStatusResponse resp;
    resp.set_log(report.log);
    resp.set_is_complete(report.is_complete);
    if (report.status) {
      resp.set_status(ToProto(*report.status));
    }
    return resp;
  });
}

RefreshRunningDeploysResponse DeployService::RefreshRunningDeploys(const RefreshRunningDeploysRequest&,
                                                                   const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.RefreshRunningDeploys", [&] {
    RequireAnyCaller(ctx_, credentials);

    const auto summary = ctx_.detector->RefreshRunningDeploys();

    RefreshRunningDeploysResponse resp;
    resp.set_checked(summary.checked);
    resp.set_completed(summary.completed);
    return resp;
  });
}

void DeployService::StreamLog(const StreamLogRequest& req, const CallerCredentials& credentials,
                              const std::function<bool(const LogChunk&)>& sink) {
  ObserveRpc("DeployService.StreamLog", [&] {
    RequireAnyCaller(ctx_, credentials);

    ctx_.follower->Follow(req.logs_pointer(), req.offset(), [&](const shipyard::deploy::LogChunk& chunk) {
      LogChunk out;
      out.set_content(chunk.content);
      out.set_offset(chunk.offset);
      out.set_complete(chunk.complete);
      out.set_timed_out(chunk.timed_out);
      out.set_error(chunk.error);
      return sink(out);
    });
  });
}

DeployRecord DeployService::GetDeploy(const GetDeployRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.GetDeploy", [&] {
    RequireAnyCaller(ctx_, credentials);
    if (req.id().empty()) {
      throw util::InvalidArgument("deploy id is required");
    }

    auto record = ctx_.lifecycle->Get(req.id());
    if (!record) {
      throw util::NotFound("deploy not found: " + req.id());
    }
    return ToProto(*record);
  });
}

ListDeploysResponse DeployService::ListDeploys(const ListDeploysRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("DeployService.ListDeploys", [&] {
    RequireAnyCaller(ctx_, credentials);

    db::model::DeployFilter filter;
    filter.status     = FromProto(req.status());
    filter.service_id = NonEmpty(req.service_id());
    if (req.limit() > 0) {
      filter.limit = std::min(req.limit(), kMaxListLimit);
    }

    ListDeploysResponse resp;
    for (const auto& record : ctx_.lifecycle->List(filter)) {
      *resp.add_records() = ToProto(record);
    }
    return resp;
  });
}

} // namespace shipyard::service
