#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace tender::factory {

/*
  Application

  Everything the server needs for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                  repository;
  std::vector<std::unique_ptr<::grpc::Service>>    grpc_services;
};

/*
  Build

  Composition root: the ONLY place that knows concrete DB types.
  The clock defaults to the system clock.
*/
Application Build(const tender::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock = nullptr);

// Exposed for tests and tooling that need a bootstrapped store without a server.
std::shared_ptr<db::Repository> BuildRepository(const tender::runtime::config::RuntimeConfig& config);

} // namespace tender::factory
