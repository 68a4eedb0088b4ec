#pragma once

#include <chrono>
#include <string>

#include "internal/gateway/execution_gateway.hpp"
#include "internal/net/http_client.hpp"

namespace shipyard::gateway {

/*
  ExecutionGateway over the gateway's HTTP contract:

    POST {url}/shell
    Authorization: Bearer {token}
    {"command": "...", "cwd": "..."}  ->  {"success": .., "stdout": .., "stderr": ..}
*/
class HttpGateway final : public ExecutionGateway {
 public:
  HttpGateway(std::string base_url, std::string token, std::chrono::milliseconds timeout);

  ShellResult Execute(const std::string& command, const std::optional<std::string>& cwd) override;

 private:
  std::string     endpoint_;
  std::string     token_;
  net::HttpClient client_;
};

} // namespace shipyard::gateway
