#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/service/service_context.hpp"

namespace vesting::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and token types.
*/
Application Build(const vesting::runtime::config::RuntimeConfig& config);

} // namespace vesting::factory
