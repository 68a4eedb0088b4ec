#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace shipyard::deploy {
class StatusPoller;
}

namespace shipyard::factory {

/*
  Application

  Owns everything the server binary needs for the lifetime of the
  process: the transport adapters handed to runtime::Server and the
  background workers that must be stopped on shutdown.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>>        grpc_services;
  std::vector<std::shared_ptr<deploy::StatusPoller>>   background_workers;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, gateway and
  notifier types.
*/
Application Build(const shipyard::runtime::config::RuntimeConfig& config);

} // namespace shipyard::factory
