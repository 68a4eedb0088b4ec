#pragma once

#include "internal/service/service_context.hpp"
#include "shipyard/v1.hpp"

namespace shipyard::service {

/*
  Operator-privileged operations. Every call requires a verified session
  and is audited.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  shipyard::v1::Allowlist GetAllowlist(const shipyard::v1::GetAllowlistRequest& req, const CallerCredentials& credentials);

  shipyard::v1::Allowlist UpdateAllowlist(const shipyard::v1::UpdateAllowlistRequest& req, const CallerCredentials& credentials);

  shipyard::v1::RestartContainerResponse RestartContainer(const shipyard::v1::RestartContainerRequest& req,
                                                          const CallerCredentials& credentials);

  shipyard::v1::CancelAbandonedDeploysResponse CancelAbandonedDeploys(const shipyard::v1::CancelAbandonedDeploysRequest& req,
                                                                      const CallerCredentials& credentials);

  shipyard::v1::ListAuditResponse ListAudit(const shipyard::v1::ListAuditRequest& req, const CallerCredentials& credentials);

 private:
  ServiceContext ctx_;
};

} // namespace shipyard::service
