#pragma once

#include <functional>

#include "internal/service/service_context.hpp"
#include "shipyard/v1.hpp"

namespace shipyard::service {

class DeployService {
 public:
  explicit DeployService(ServiceContext ctx);

  // User-initiated; requires a verified session.
  shipyard::v1::DeployResponse Deploy(const shipyard::v1::DeployRequest& req, const CallerCredentials& credentials);

  // System-initiated (verified webhook); requires an internal token.
  shipyard::v1::DeployResponse SystemDeploy(const shipyard::v1::SystemDeployRequest& req, const CallerCredentials& credentials);

  // Deploys every docker service with an automatic strategy; one failure
  // does not stop the rest. Requires a verified session.
  shipyard::v1::DeployAllResponse DeployAll(const shipyard::v1::DeployAllRequest& req, const CallerCredentials& credentials);

  shipyard::v1::CheckStatusResponse CheckStatus(const shipyard::v1::CheckStatusRequest& req, const CallerCredentials& credentials);

  shipyard::v1::RefreshRunningDeploysResponse RefreshRunningDeploys(const shipyard::v1::RefreshRunningDeploysRequest& req,
                                                                    const CallerCredentials& credentials);

  shipyard::v1::DeployRecord GetDeploy(const shipyard::v1::GetDeployRequest& req, const CallerCredentials& credentials);

  shipyard::v1::ListDeploysResponse ListDeploys(const shipyard::v1::ListDeploysRequest& req, const CallerCredentials& credentials);

  // Calls sink for every poll until the log completes, the follower gives
  // up, or sink returns false.
  void StreamLog(const shipyard::v1::StreamLogRequest& req, const CallerCredentials& credentials,
                 const std::function<bool(const shipyard::v1::LogChunk&)>& sink);

 private:
  shipyard::v1::DeployResponse RunDeploy(const shipyard::v1::DeployRequest& req, const std::string& actor);

  ServiceContext ctx_;
};

} // namespace shipyard::service
