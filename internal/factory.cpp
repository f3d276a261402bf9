#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/bus/local_drone_bus.hpp"
#include "internal/core/backend_lifecycle.hpp"
#include "internal/core/backend_registry.hpp"
#include "internal/core/connect_protocol.hpp"
#include "internal/core/node_registry.hpp"
#include "internal/core/termination_watchdog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/grpc/controller_server.hpp"
#include "internal/grpc/drone_bus_server.hpp"
#include "internal/lock/key_lock_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/controller_service.hpp"
#include "internal/service/drone_bus_service.hpp"
#include "internal/util/time.hpp"
#if FLOTILLA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLOTILLA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flotilla::factory {

using namespace flotilla;

std::shared_ptr<db::Repository> BuildRepository(const flotilla::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLOTILLA_DB_SQLITE
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->BootstrapSchema();
    FLOTILLA_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLOTILLA_DB_POSTGRES
    auto pool       = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->BootstrapSchema();
    FLOTILLA_LOG_INFO("using postgres repository", {observability::UintField("max_connections", database.postgres().max_connections())});
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLOTILLA_LOG_WARN("no database configured, using in-memory repository; state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildContext(const flotilla::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  const auto& scheduler  = config.scheduler();
  const auto& controller = config.controller();

  const uint64_t staleness_ms = static_cast<uint64_t>(scheduler.drone_staleness_seconds()) * 1000;

  service::ServiceContext ctx;
  ctx.repository = std::move(repository);
  ctx.events     = std::make_shared<events::EventLog>(ctx.repository, scheduler.event_retention_max_entries());
  ctx.locks      = std::make_shared<lock::KeyLockTable>(ctx.repository, ctx.events);
  ctx.bus        = std::make_shared<bus::LocalDroneBus>();
  ctx.backends   = std::make_shared<core::BackendRegistry>(ctx.repository, ctx.events);
  ctx.lifecycle  = std::make_shared<core::BackendLifecycle>(ctx.repository, ctx.events, ctx.locks, ctx.bus);
  ctx.nodes      = std::make_shared<core::NodeRegistry>(ctx.repository, ctx.events, ctx.bus, controller.id(), staleness_ms);
  ctx.watchdog   = std::make_shared<core::TerminationWatchdog>(ctx.repository, ctx.lifecycle, scheduler.hard_terminate_grace_seconds());

  core::ConnectSettings settings;
  settings.default_cluster = controller.default_cluster();
  settings.url_scheme      = controller.backend_url_scheme();
  settings.staleness_ms    = staleness_ms;
  ctx.connect = std::make_shared<core::ConnectProtocol>(ctx.repository, ctx.events, ctx.locks, ctx.backends, ctx.bus, std::move(settings));

  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const flotilla::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.context = BuildContext(config, BuildRepository(config));

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  const auto& scheduler = config.scheduler();

  auto watchdog = app.context.watchdog;
  app.background_workers.push_back(std::make_shared<runtime::PeriodicWorker>(
      "termination-watchdog", std::chrono::milliseconds(scheduler.watchdog_interval_ms()),
      [watchdog] { watchdog->Sweep(util::NowMillis()); }));

  auto nodes = app.context.nodes;
  app.background_workers.push_back(std::make_shared<runtime::PeriodicWorker>(
      "drone-sweep", std::chrono::milliseconds(scheduler.node_sweep_interval_ms()), [nodes] { nodes->SweepStale(util::NowMillis()); }));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto controller_service = std::make_shared<service::ControllerService>(app.context);
  auto drone_bus_service  = std::make_shared<service::DroneBusService>(app.context);

  app.grpc_services.push_back(std::make_unique<grpc::ControllerServer>(controller_service));
  app.grpc_services.push_back(std::make_unique<grpc::DroneBusServer>(drone_bus_service));

  return app;
}

void Application::Start() {
  for (auto& worker : background_workers) {
    worker->Start();
  }
}

void Application::Stop() {
  for (auto& worker : background_workers) {
    worker->Stop();
  }
  if (context.events) context.events->Shutdown();
  if (context.bus) context.bus->Shutdown();
}

} // namespace flotilla::factory
