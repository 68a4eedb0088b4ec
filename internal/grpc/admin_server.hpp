#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "shipyard/v1/admin_service.grpc.pb.h"

namespace shipyard::grpc {

class AdminServer final : public shipyard::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<shipyard::service::AdminService> svc);

  ::grpc::Status GetAllowlist(::grpc::ServerContext*, const shipyard::v1::GetAllowlistRequest*, shipyard::v1::Allowlist*) override;

  ::grpc::Status UpdateAllowlist(::grpc::ServerContext*, const shipyard::v1::UpdateAllowlistRequest*, shipyard::v1::Allowlist*) override;

  ::grpc::Status RestartContainer(::grpc::ServerContext*, const shipyard::v1::RestartContainerRequest*,
                                  shipyard::v1::RestartContainerResponse*) override;

  ::grpc::Status CancelAbandonedDeploys(::grpc::ServerContext*, const shipyard::v1::CancelAbandonedDeploysRequest*,
                                        shipyard::v1::CancelAbandonedDeploysResponse*) override;

  ::grpc::Status ListAudit(::grpc::ServerContext*, const shipyard::v1::ListAuditRequest*, shipyard::v1::ListAuditResponse*) override;

 private:
  std::shared_ptr<shipyard::service::AdminService> service_;
};

} // namespace shipyard::grpc
