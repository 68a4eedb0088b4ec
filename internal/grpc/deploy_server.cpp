#include "deploy_server.hpp"

#include "grpc_error.hpp"

namespace shipyard::grpc {

using namespace shipyard::v1;

DeployServer::DeployServer(std::shared_ptr<shipyard::service::DeployService> svc) : service_(std::move(svc)) {
}

::grpc::Status DeployServer::Deploy(::grpc::ServerContext* ctx, const DeployRequest* req, DeployResponse* resp) {
  try {
    *resp = service_->Deploy(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::SystemDeploy(::grpc::ServerContext* ctx, const SystemDeployRequest* req, DeployResponse* resp) {
  try {
    *resp = service_->SystemDeploy(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::DeployAll(::grpc::ServerContext* ctx, const DeployAllRequest* req, DeployAllResponse* resp) {
  try {
    *resp = service_->DeployAll(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::CheckStatus(::grpc::ServerContext* ctx, const CheckStatusRequest* req, CheckStatusResponse* resp) {
  try {
    *resp = service_->CheckStatus(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::RefreshRunningDeploys(::grpc::ServerContext* ctx, const RefreshRunningDeploysRequest* req,
                                                   RefreshRunningDeploysResponse* resp) {
  try {
    *resp = service_->RefreshRunningDeploys(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::GetDeploy(::grpc::ServerContext* ctx, const GetDeployRequest* req, DeployRecord* resp) {
  try {
    *resp = service_->GetDeploy(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::ListDeploys(::grpc::ServerContext* ctx, const ListDeploysRequest* req, ListDeploysResponse* resp) {
  try {
    *resp = service_->ListDeploys(*req, CredentialsFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeployServer::StreamLog(::grpc::ServerContext* ctx, const StreamLogRequest* req, ::grpc::ServerWriter<LogChunk>* writer) {
  try {
    service_->StreamLog(*req, CredentialsFrom(ctx), [&](const LogChunk& chunk) { return !ctx->IsCancelled() && writer->Write(chunk); });
    if (ctx->IsCancelled()) {
      return ::grpc::Status::CANCELLED;
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shipyard::grpc
