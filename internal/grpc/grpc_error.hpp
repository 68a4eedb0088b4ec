#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// x-session-token / x-internal-token metadata.
shipyard::service::CallerCredentials CredentialsFrom(const ::grpc::ServerContext* context);

} // namespace shipyard::grpc
