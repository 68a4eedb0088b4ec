#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace shipyard::grpc {

using namespace shipyard::v1;

AdminServer::AdminServer(std::shared_ptr<shipyard::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetAllowlist(::grpc::ServerContext* ctx, const GetAllowlistRequest* req, Allowlist* resp) {
  try {
    *resp = service_->GetAllowlist(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::UpdateAllowlist(::grpc::ServerContext* ctx, const UpdateAllowlistRequest* req, Allowlist* resp) {
  try {
    *resp = service_->UpdateAllowlist(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RestartContainer(::grpc::ServerContext* ctx, const RestartContainerRequest* req,
                                             RestartContainerResponse* resp) {
  try {
    *resp = service_->RestartContainer(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::CancelAbandonedDeploys(::grpc::ServerContext* ctx, const CancelAbandonedDeploysRequest* req,
                                                   CancelAbandonedDeploysResponse* resp) {
  try {
    *resp = service_->CancelAbandonedDeploys(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListAudit(::grpc::ServerContext* ctx, const ListAuditRequest* req, ListAuditResponse* resp) {
  try {
    *resp = service_->ListAudit(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shipyard::grpc
