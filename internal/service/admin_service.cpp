#include "admin_service.hpp"

#include <algorithm>
#include <string>

#include "internal/allowlist/allowlist_guard.hpp"
#include "internal/allowlist/allowlist_store.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/command/shell_command.hpp"
#include "internal/deploy/deploy_lifecycle.hpp"
#include "internal/gateway/execution_gateway.hpp"
#include "internal/service/rpc_support.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::service {

using namespace shipyard::v1;
using shipyard::db::model::AuditOutcome;
using shipyard::observability::StringField;

namespace {

constexpr uint32_t      kDefaultAuditLimit = 100;
constexpr uint32_t      kMaxAuditLimit     = 1000;
constexpr std::uint64_t kDefaultAbandonAge = 60 * 60; // one hour

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Allowlist AdminService::GetAllowlist(const GetAllowlistRequest&, const CallerCredentials& credentials) {
  return ObserveRpc("AdminService.GetAllowlist", [&] {
    RequireSession(ctx_, credentials);
    return ctx_.allowlist->Snapshot();
  });
}

Allowlist AdminService::UpdateAllowlist(const UpdateAllowlistRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("AdminService.UpdateAllowlist", [&] {
    const auto actor = RequireSession(ctx_, credentials);

    try {
      auto updated = ctx_.allowlist->Replace(req.allowlist());
      ctx_.audit->Record(actor, "allowlist.update", "allowlist", "", AuditOutcome::kOk,
                         "repo_paths=" + std::to_string(updated.repo_paths_size()) +
                             " compose_projects=" + std::to_string(updated.compose_projects_size()) +
                             " container_names=" + std::to_string(updated.container_names_size()));
      SHIPYARD_LOG_INFO("allowlist updated", {StringField("actor", actor)});
      return updated;
    } catch (const std::exception& e) {
      ctx_.audit->Record(actor, "allowlist.update", "allowlist", "", AuditOutcome::kFailed, e.what());
      throw;
    }
  });
}

RestartContainerResponse AdminService::RestartContainer(const RestartContainerRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("AdminService.RestartContainer", [&] {
    const auto  actor = RequireSession(ctx_, credentials);
    const auto& name  = req.container_name();

    command::RequireContainerName(name);
    ctx_.guard->Require(allowlist::AllowlistKind::kContainerName, name, actor, "container.restart");

    const auto result = ctx_.gateway->Execute(command::RestartContainer(name));
    const auto output = !result.stdout_text.empty() ? result.stdout_text : result.stderr_text;

    ctx_.audit->Record(actor, "container.restart", "container_name", name, result.success ? AuditOutcome::kOk : AuditOutcome::kFailed,
                       output);
    SHIPYARD_LOG_INFO("container restart", {StringField("container", name), StringField("actor", actor),
                                            shipyard::observability::BoolField("success", result.success)});

    RestartContainerResponse resp;
    resp.set_success(result.success);
    resp.set_output(output);
    return resp;
  });
}

CancelAbandonedDeploysResponse AdminService::CancelAbandonedDeploys(const CancelAbandonedDeploysRequest& req,
                                                                    const CallerCredentials& credentials) {
  return ObserveRpc("AdminService.CancelAbandonedDeploys", [&] {
    const auto actor      = RequireSession(ctx_, credentials);
    const auto older_than = req.older_than_seconds() > 0 ? req.older_than_seconds() : kDefaultAbandonAge;

    const auto cancelled = ctx_.lifecycle->CancelAbandoned(older_than);
    for (const auto& id : cancelled) {
      ctx_.audit->Record(actor, "deploy.cancel", "deploy", id, AuditOutcome::kOk, "abandoned for more than " + std::to_string(older_than) + "s");
    }

    CancelAbandonedDeploysResponse resp;
    resp.set_cancelled(static_cast<uint32_t>(cancelled.size()));
    return resp;
  });
}

ListAuditResponse AdminService::ListAudit(const ListAuditRequest& req, const CallerCredentials& credentials) {
  return ObserveRpc("AdminService.ListAudit", [&] {
    RequireSession(ctx_, credentials);

    const auto limit = req.limit() == 0 ? kDefaultAuditLimit : std::min(req.limit(), kMaxAuditLimit);

    ListAuditResponse resp;
    for (const auto& record : ctx_.audit->Recent(limit)) {
      *resp.add_events() = ToProto(record);
    }
    return resp;
  });
}

} // namespace shipyard::service
