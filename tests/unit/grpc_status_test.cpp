#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/auth/privilege_gate.hpp"
#include "internal/deploy/completion_detector.hpp"
#include "internal/deploy/deploy_orchestrator.hpp"
#include "internal/grpc/deploy_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "test_support.hpp"

namespace {

using shipyard::grpc::CredentialsFrom;
using shipyard::grpc::ToStatus;
using shipyard::testing::CatalogConfig;
using shipyard::testing::Harness;
using namespace shipyard::util;

void TestExceptionMapping() {
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(OperationBlocked("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(PermissionDenied("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(TransportError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(ResolutionError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(ConfigurationError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(OperationBlocked("Repository path '/etc' is not in the allowlist"));
  assert(status.error_message() == "Repository path '/etc' is not in the allowlist");
}

void TestMissingContextYieldsEmptyCredentials() {
  const auto credentials = CredentialsFrom(nullptr);
  assert(credentials.session_token.empty());
  assert(credentials.internal_token.empty());
}

void TestUnauthenticatedCallIsRejected() {
  Harness h(CatalogConfig("/srv/web"));

  shipyard::runtime::config::AuthConfig auth;
  auto*                                 session = auth.add_session_tokens();
  session->set_actor("alice");
  session->set_token("alice-session");

  shipyard::service::ServiceContext ctx;
  ctx.orchestrator = std::make_shared<shipyard::deploy::DeployOrchestrator>(h.gateway, h.guard, h.catalog, h.lifecycle, h.notifier, h.audit,
                                                                            shipyard::deploy::OrchestratorOptions{});
  ctx.detector     = std::make_shared<shipyard::deploy::CompletionDetector>(
      h.gateway, h.lifecycle, h.catalog, h.notifier, shipyard::deploy::LogPointerPolicy("/tmp"), shipyard::deploy::LogClassifier(),
      shipyard::deploy::DetectorOptions{});
  ctx.lifecycle  = h.lifecycle;
  ctx.allowlist  = h.store;
  ctx.guard      = h.guard;
  ctx.audit      = h.audit;
  ctx.privileges = std::make_shared<shipyard::auth::StaticTokenGate>(auth);
  ctx.gateway    = h.gateway;
  ctx.catalog    = h.catalog;

  shipyard::grpc::DeployServer server(std::make_shared<shipyard::service::DeployService>(ctx));

  shipyard::v1::DeployRequest req;
  req.set_project_id("p-web");
  shipyard::v1::DeployResponse resp;
  ::grpc::ServerContext        grpc_ctx;

  const auto status = server.Deploy(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(h.gateway->commands.empty());

  shipyard::v1::GetDeployRequest get;
  get.set_id("missing");
  shipyard::v1::DeployRecord record;
  assert(server.GetDeploy(&grpc_ctx, &get, &record).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingContextYieldsEmptyCredentials();
  TestUnauthenticatedCallIsRejected();

  std::cout << "shipyard_unit_grpc_status: pass\n";
  return 0;
}
