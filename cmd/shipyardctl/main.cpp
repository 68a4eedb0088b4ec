#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "shipyard/v1.hpp"
#include "shipyard/v1/admin_service.grpc.pb.h"
#include "shipyard/v1/deploy_service.grpc.pb.h"

using namespace shipyard::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  shipyardctl <addr> deploy <project_id> [branch] [custom_path]\n"
            << "  shipyardctl <addr> deploy-service <service_id> [branch]\n"
            << "  shipyardctl <addr> system-deploy <triggered_by> <project_id> [branch]\n"
            << "  shipyardctl <addr> deploy-all [branch]\n"
            << "  shipyardctl <addr> status <logs_pointer> [deploy_id]\n"
            << "  shipyardctl <addr> stream <logs_pointer> [offset]\n"
            << "  shipyardctl <addr> refresh\n"
            << "  shipyardctl <addr> get <deploy_id>\n"
            << "  shipyardctl <addr> list [pending|running|success|failed|cancelled] [limit]\n"
            << "  shipyardctl <addr> allowlist\n"
            << "  shipyardctl <addr> allowlist-add <repo_path|compose_project|container_name> <value>\n"
            << "  shipyardctl <addr> restart <container_name>\n"
            << "  shipyardctl <addr> cancel-abandoned [older_than_seconds]\n"
            << "  shipyardctl <addr> audit [limit]\n"
            << "\n"
            << "Tokens are read from SHIPYARD_SESSION_TOKEN and SHIPYARD_INTERNAL_TOKEN.\n";
}

static std::optional<DeployStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return DEPLOY_STATUS_PENDING;
  if (value == "running") return DEPLOY_STATUS_RUNNING;
  if (value == "success") return DEPLOY_STATUS_SUCCESS;
  if (value == "failed") return DEPLOY_STATUS_FAILED;
  if (value == "cancelled") return DEPLOY_STATUS_CANCELLED;
  return std::nullopt;
}

static const char* StatusName(DeployStatus status) {
  switch (status) {
    case DEPLOY_STATUS_PENDING:
      return "pending";
    case DEPLOY_STATUS_RUNNING:
      return "running";
    case DEPLOY_STATUS_SUCCESS:
      return "success";
    case DEPLOY_STATUS_FAILED:
      return "failed";
    case DEPLOY_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

static void PrintRecord(const DeployRecord& record) {
  std::cout << record.id() << " status=" << StatusName(record.status()) << " service=" << record.service_id()
            << " commit=" << record.commit_sha() << " by=" << record.triggered_by();
  if (!record.error_message().empty()) {
    std::cout << " error=\"" << record.error_message() << "\"";
  }
  std::cout << "\n";
}

static void AttachCredentials(grpc::ClientContext& ctx) {
  if (const char* token = std::getenv("SHIPYARD_SESSION_TOKEN")) {
    ctx.AddMetadata("x-session-token", token);
  }
  if (const char* token = std::getenv("SHIPYARD_INTERNAL_TOKEN")) {
    ctx.AddMetadata("x-internal-token", token);
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto deploy_stub = DeployService::NewStub(channel);
  auto admin_stub  = AdminService::NewStub(channel);

  grpc::ClientContext ctx;
  AttachCredentials(ctx);

  // ------------------------------------------------------------

  if (cmd == "deploy" || cmd == "deploy-service") {
    if (argc < 4) return 1;

    DeployRequest req;
    if (cmd == "deploy") {
      req.set_project_id(argv[3]);
      if (argc >= 6) req.set_custom_path(argv[5]);
    } else {
      req.set_service_id(argv[3]);
    }
    if (argc >= 5) req.set_branch(argv[4]);

    DeployResponse resp;

    auto status = deploy_stub->Deploy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.transcript() << "\n";
    std::cout << "deploy_id=" << resp.deploy_id() << "\n";
    std::cout << "logs=" << resp.logs_pointer() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "system-deploy") {
    if (argc < 5) return 1;

    SystemDeployRequest req;
    req.set_triggered_by(argv[3]);
    req.mutable_deploy()->set_project_id(argv[4]);
    if (argc >= 6) req.mutable_deploy()->set_branch(argv[5]);

    DeployResponse resp;

    auto status = deploy_stub->SystemDeploy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deploy_id=" << resp.deploy_id() << "\n";
    std::cout << "logs=" << resp.logs_pointer() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deploy-all") {
    DeployAllRequest req;
    if (argc >= 4) req.set_branch(argv[3]);

    DeployAllResponse resp;

    auto status = deploy_stub->DeployAll(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& result : resp.results()) {
      if (result.success()) {
        std::cout << result.service_id() << " deploy_id=" << result.deploy_id() << " logs=" << result.logs_pointer() << "\n";
      } else {
        std::cout << result.service_id() << " error=\"" << result.error() << "\"\n";
      }
    }
    std::cout << "deployed=" << resp.deployed() << " failed=" << resp.failed() << " total=" << resp.total() << "\n";
    return resp.failed() == 0 ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "stream") {
    if (argc < 4) return 1;

    StreamLogRequest req;
    req.set_logs_pointer(argv[3]);
    if (argc >= 5) req.set_offset(std::stoull(argv[4]));

    auto reader = deploy_stub->StreamLog(&ctx, req);

    LogChunk chunk;
    bool     complete = false;
    while (reader->Read(&chunk)) {
      std::cout << chunk.content() << std::flush;
      if (!chunk.error().empty()) {
        std::cerr << "read error: " << chunk.error() << "\n";
      }
      if (chunk.timed_out()) {
        std::cerr << "gave up at offset " << chunk.offset() << "\n";
      }
      complete = chunk.complete();
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return complete ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    CheckStatusRequest req;
    req.set_logs_pointer(argv[3]);
    if (argc >= 5) req.set_deploy_id(argv[4]);

    CheckStatusResponse resp;

    auto status = deploy_stub->CheckStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.log() << "\n";
    std::cout << "complete=" << (resp.is_complete() ? "true" : "false") << " status=" << StatusName(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "refresh") {
    RefreshRunningDeploysRequest  req;
    RefreshRunningDeploysResponse resp;

    auto status = deploy_stub->RefreshRunningDeploys(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "checked=" << resp.checked() << " completed=" << resp.completed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetDeployRequest req;
    req.set_id(argv[3]);

    DeployRecord resp;

    auto status = deploy_stub->GetDeploy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRecord(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListDeploysRequest req;
    if (argc >= 4) {
      auto parsed = ParseStatus(argv[3]);
      if (!parsed) {
        std::cerr << "unknown status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(*parsed);
    }
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    ListDeploysResponse resp;

    auto status = deploy_stub->ListDeploys(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.records()) {
      PrintRecord(record);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "allowlist") {
    GetAllowlistRequest req;
    Allowlist           resp;

    auto status = admin_stub->GetAllowlist(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& path : resp.repo_paths()) std::cout << "repo_path=" << path << "\n";
    for (const auto& project : resp.compose_projects()) std::cout << "compose_project=" << project << "\n";
    for (const auto& name : resp.container_names()) std::cout << "container_name=" << name << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "allowlist-add") {
    if (argc < 5) return 1;

    const std::string kind  = argv[3];
    const std::string value = argv[4];

    Allowlist current;

    auto status = admin_stub->GetAllowlist(&ctx, GetAllowlistRequest{}, &current);
    if (!status.ok()) return Fail(status);

    if (kind == "repo_path") {
      current.add_repo_paths(value);
    } else if (kind == "compose_project") {
      current.add_compose_projects(value);
    } else if (kind == "container_name") {
      current.add_container_names(value);
    } else {
      std::cerr << "unknown allowlist kind: " << kind << "\n";
      return 1;
    }

    // A ClientContext serves a single call.
    grpc::ClientContext update_ctx;
    AttachCredentials(update_ctx);

    UpdateAllowlistRequest req;
    *req.mutable_allowlist() = current;

    Allowlist resp;

    status = admin_stub->UpdateAllowlist(&update_ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "repo_paths=" << resp.repo_paths_size() << " compose_projects=" << resp.compose_projects_size()
              << " container_names=" << resp.container_names_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "restart") {
    if (argc < 4) return 1;

    RestartContainerRequest req;
    req.set_container_name(argv[3]);

    RestartContainerResponse resp;

    auto status = admin_stub->RestartContainer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.output() << "\n";
    return resp.success() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel-abandoned") {
    CancelAbandonedDeploysRequest req;
    if (argc >= 4) req.set_older_than_seconds(std::stoull(argv[3]));

    CancelAbandonedDeploysResponse resp;

    auto status = admin_stub->CancelAbandonedDeploys(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cancelled=" << resp.cancelled() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    ListAuditRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));

    ListAuditResponse resp;

    auto status = admin_stub->ListAudit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.at().seconds() << " " << event.actor() << " " << event.action() << " " << event.entity_type() << "="
                << event.entity_id() << " outcome=" << event.outcome() << " " << event.detail() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
