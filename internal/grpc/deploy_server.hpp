#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/deploy_service.hpp"
#include "shipyard/v1/deploy_service.grpc.pb.h"

namespace shipyard::grpc {

class DeployServer final : public shipyard::v1::DeployService::Service {
 public:
  explicit DeployServer(std::shared_ptr<shipyard::service::DeployService> svc);

  ::grpc::Status Deploy(::grpc::ServerContext*, const shipyard::v1::DeployRequest*, shipyard::v1::DeployResponse*) override;

  ::grpc::Status SystemDeploy(::grpc::ServerContext*, const shipyard::v1::SystemDeployRequest*, shipyard::v1::DeployResponse*) override;

  ::grpc::Status DeployAll(::grpc::ServerContext*, const shipyard::v1::DeployAllRequest*, shipyard::v1::DeployAllResponse*) override;

  ::grpc::Status CheckStatus(::grpc::ServerContext*, const shipyard::v1::CheckStatusRequest*, shipyard::v1::CheckStatusResponse*) override;

  ::grpc::Status RefreshRunningDeploys(::grpc::ServerContext*, const shipyard::v1::RefreshRunningDeploysRequest*,
                                       shipyard::v1::RefreshRunningDeploysResponse*) override;

  ::grpc::Status GetDeploy(::grpc::ServerContext*, const shipyard::v1::GetDeployRequest*, shipyard::v1::DeployRecord*) override;

  ::grpc::Status ListDeploys(::grpc::ServerContext*, const shipyard::v1::ListDeploysRequest*, shipyard::v1::ListDeploysResponse*) override;

  ::grpc::Status StreamLog(::grpc::ServerContext*, const shipyard::v1::StreamLogRequest*,
                           ::grpc::ServerWriter<shipyard::v1::LogChunk>*) override;

 private:
  std::shared_ptr<shipyard::service::DeployService> service_;
};

} // namespace shipyard::grpc
