#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/runtime/periodic_worker.hpp"
#include "internal/service/service_context.hpp"

namespace flotilla::factory {

/*
  Application

  Owns all long-lived objects used by the controller process.
  Background workers are created stopped; Start() launches them.
*/
struct Application {
  service::ServiceContext context;

  std::vector<std::unique_ptr<::grpc::Service>>         grpc_services;
  std::vector<std::shared_ptr<runtime::PeriodicWorker>> background_workers;

  void Start();

  // Stops workers, ends open streams and drops queued bus commands.
  void Stop();
};

/*
  Composition root. The only place that knows concrete repository types.
*/
std::shared_ptr<db::Repository> BuildRepository(const flotilla::runtime::config::RuntimeConfig& config);

Application Build(const flotilla::runtime::config::RuntimeConfig& config);

// Wires the core and services around an existing repository; used by Build() and tests.
service::ServiceContext BuildContext(const flotilla::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

} // namespace flotilla::factory
