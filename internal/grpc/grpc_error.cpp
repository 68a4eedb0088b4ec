#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace shipyard::grpc {

namespace {

std::string Metadata(const ::grpc::ServerContext* context, const char* key) {
  if (!context) {
    return {};
  }
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace shipyard::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const OperationBlocked*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const CommandFailed*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const ResolutionError*>(&e) || dynamic_cast<const InvalidState*>(&e) ||
      dynamic_cast<const ConfigurationError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

shipyard::service::CallerCredentials CredentialsFrom(const ::grpc::ServerContext* context) {
  shipyard::service::CallerCredentials credentials;
  credentials.session_token  = Metadata(context, "x-session-token");
  credentials.internal_token = Metadata(context, "x-internal-token");
  return credentials;
}

} // namespace shipyard::grpc
