#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "flotilla/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if FLOTILLA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if FLOTILLA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using flotilla::db::BackendFilter;
using flotilla::db::DroneFilter;
using flotilla::db::ErrorCode;
using flotilla::db::Repository;
using flotilla::db::TransactionConflict;
using flotilla::db::memory::MemoryRepository;
using flotilla::db::model::BackendRecord;
using flotilla::db::model::DroneRecord;
using flotilla::db::model::EventRecord;
using flotilla::db::model::KeyLockRecord;

namespace v1 = flotilla::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

DroneRecord MakeDrone(const std::string& cluster, const std::string& name) {
  DroneRecord drone;
  drone.cluster           = cluster;
  drone.name              = name;
  drone.controller        = "controller-it";
  drone.version           = "1.2.3";
  drone.build_hash        = "abc123";
  drone.status            = v1::DRONE_STATUS_STARTING;
  drone.last_heartbeat_ms = NowMs();
  return drone;
}

BackendRecord MakeBackend(const std::string& id, const std::string& cluster, uint64_t drone_id) {
  BackendRecord backend;
  backend.id                = id;
  backend.cluster           = cluster;
  backend.drone_id          = drone_id;
  backend.status            = v1::BACKEND_STATUS_SCHEDULED;
  backend.last_status_ms    = NowMs();
  backend.last_keepalive_ms = backend.last_status_ms;
  backend.spawn_config_json = R"({"executable":{"image":"ghcr.io/example/app:1"}})";
  return backend;
}

void VerifyDroneLifecycle(Repository& repo, const std::string& cluster) {
  auto tx = repo.Begin();

  auto first = MakeDrone(cluster, "drone-a");
  assert(repo.InsertDrone(*tx, first));
  assert(first.id != 0);

  // a second live drone under the same name is refused
  auto duplicate = MakeDrone(cluster, "drone-a");
  auto dup       = repo.InsertDrone(*tx, duplicate);
  assert(!dup);
  assert(dup.code == ErrorCode::ConstraintViolation);

  auto live = repo.GetLiveDroneByName(*tx, cluster, "drone-a");
  assert(live.has_value());
  assert(live->id == first.id);
  assert(live->version == "1.2.3");
  assert(live->build_hash == "abc123");
  assert(!live->draining);

  live->status   = v1::DRONE_STATUS_TERMINATED;
  live->draining = true;
  assert(repo.UpdateDrone(*tx, *live));
  assert(!repo.GetLiveDroneByName(*tx, cluster, "drone-a").has_value());

  // the name is free again once the old drone is terminated
  auto second = MakeDrone(cluster, "drone-a");
  assert(repo.InsertDrone(*tx, second));
  assert(second.id > first.id);
  assert(repo.GetLiveDroneByName(*tx, cluster, "drone-a")->id == second.id);

  DroneFilter filter;
  filter.cluster = cluster;
  assert(repo.ListDrones(*tx, filter).size() == 2);
  filter.include_terminated = false;
  auto live_only            = repo.ListDrones(*tx, filter);
  assert(live_only.size() == 1);
  assert(live_only[0].id == second.id);

  auto stored = repo.GetDrone(*tx, first.id);
  assert(stored.has_value());
  assert(stored->status == v1::DRONE_STATUS_TERMINATED);
  assert(stored->draining);

  DroneRecord missing;
  missing.id = 987654321;
  assert(repo.UpdateDrone(*tx, missing).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyBackendsAndKeyLocks(Repository& repo, const std::string& cluster) {
  auto tx = repo.Begin();

  auto drone = MakeDrone(cluster, "drone-b");
  assert(repo.InsertDrone(*tx, drone));

  auto backend                 = MakeBackend(cluster + "-backend-1", cluster, drone.id);
  backend.expiration_ms        = backend.last_status_ms + 60'000;
  backend.allowed_idle_seconds = 300;
  backend.key                  = "session";
  assert(repo.InsertBackend(*tx, backend));
  assert(repo.InsertBackend(*tx, backend).code == ErrorCode::AlreadyExists);

  auto other = MakeBackend(cluster + "-backend-2", cluster, drone.id);
  assert(repo.InsertBackend(*tx, other));

  auto read = repo.GetBackend(*tx, backend.id);
  assert(read.has_value());
  assert(read->drone_id == drone.id);
  assert(read->expiration_ms == backend.expiration_ms);
  assert(read->allowed_idle_seconds == 300u);
  assert(read->key == "session");
  assert(read->spawn_config_json.find("ghcr.io/example/app:1") != std::string::npos);

  auto plain = repo.GetBackend(*tx, other.id);
  assert(plain.has_value());
  assert(!plain->expiration_ms.has_value());
  assert(!plain->allowed_idle_seconds.has_value());

  read->status         = v1::BACKEND_STATUS_TERMINATED;
  read->last_status_ms = read->last_status_ms + 10;
  assert(repo.UpdateBackend(*tx, *read));

  BackendFilter filter;
  filter.cluster = cluster;
  auto all       = repo.ListBackends(*tx, filter);
  assert(all.size() == 2);
  assert(all[0].id < all[1].id);

  filter.include_terminated = false;
  auto live                 = repo.ListBackends(*tx, filter);
  assert(live.size() == 1);
  assert(live[0].id == other.id);

  filter.drone_id = drone.id + 1000;
  assert(repo.ListBackends(*tx, filter).empty());

  KeyLockRecord lock;
  lock.cluster        = cluster;
  lock.key            = "session";
  lock.backend_id     = backend.id;
  lock.tag            = "t1";
  lock.acquired_at_ms = NowMs();
  assert(repo.UpsertKeyLock(*tx, lock));

  auto held = repo.GetKeyLock(*tx, cluster, "session");
  assert(held.has_value());
  assert(held->backend_id == backend.id);
  assert(held->tag == "t1");

  // rebinding replaces the row
  lock.backend_id = other.id;
  lock.tag        = "t2";
  assert(repo.UpsertKeyLock(*tx, lock));
  held = repo.GetKeyLock(*tx, cluster, "session");
  assert(held->backend_id == other.id);
  assert(held->tag == "t2");

  // locks are scoped per cluster
  assert(!repo.GetKeyLock(*tx, cluster + "-elsewhere", "session").has_value());

  assert(repo.DeleteKeyLock(*tx, cluster, "session"));
  assert(!repo.GetKeyLock(*tx, cluster, "session").has_value());
  assert(repo.DeleteKeyLock(*tx, cluster, "session"));

  tx->Commit();
}

void VerifyEvents(Repository& repo) {
  auto tx = repo.Begin();

  const auto base = repo.GetMaxEventId(*tx).value_or(0);

  std::vector<uint64_t> ids;
  for (int i = 0; i < 5; ++i) {
    EventRecord event;
    event.kind         = "backend_status";
    event.key          = (i % 2 == 0) ? std::optional<std::string>("backend-even") : std::nullopt;
    event.payload_json = R"({"status":"BACKEND_STATUS_READY"})";
    assert(repo.AppendEvent(*tx, event));
    assert(event.id > base);
    ids.push_back(event.id);
  }
  for (std::size_t i = 1; i < ids.size(); ++i) {
    assert(ids[i] > ids[i - 1]);
  }
  assert(repo.GetMaxEventId(*tx) == ids.back());

  auto all = repo.ReadEvents(*tx, base, std::nullopt, std::nullopt);
  assert(all.size() == 5);
  assert(all[0].timestamp_ms != 0);
  assert(!all[1].key.has_value());

  auto keyed = repo.ReadEvents(*tx, base, std::string("backend-even"), std::nullopt);
  assert(keyed.size() == 3);
  for (const auto& event : keyed) {
    assert(event.key == std::string("backend-even"));
  }

  auto limited = repo.ReadEvents(*tx, ids[1], std::nullopt, 2);
  assert(limited.size() == 2);
  assert(limited[0].id == ids[2]);
  assert(limited[1].id == ids[3]);

  assert(repo.TrimEventsToMaxCount(*tx, 2));
  auto trimmed = repo.ReadEvents(*tx, 0, std::nullopt, std::nullopt);
  assert(trimmed.size() == 2);
  assert(trimmed[0].id == ids[3]);
  assert(trimmed[1].id == ids[4]);

  // ids keep growing after a trim
  EventRecord next;
  next.kind         = "drone_status";
  next.payload_json = "{}";
  assert(repo.AppendEvent(*tx, next));
  assert(next.id > ids.back());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& cluster) {
  {
    auto tx    = repo.Begin();
    auto drone = MakeDrone(cluster, "drone-rollback");
    assert(repo.InsertDrone(*tx, drone));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetLiveDroneByName(*tx, cluster, "drone-rollback").has_value());
    tx->Commit();
  }

  // updates, deletes and appends all come back out
  const std::string backend_id = cluster + "-rollback";
  {
    auto tx    = repo.Begin();
    auto drone = MakeDrone(cluster, "drone-rollback-kept");
    assert(repo.InsertDrone(*tx, drone));
    assert(repo.InsertBackend(*tx, MakeBackend(backend_id, cluster, drone.id)));
    assert(repo.UpsertKeyLock(*tx, KeyLockRecord{cluster, "rollback", backend_id, "t1", NowMs()}));
    tx->Commit();
  }

  std::optional<uint64_t> max_event_before;
  {
    auto tx          = repo.Begin();
    max_event_before = repo.GetMaxEventId(*tx);
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto backend = repo.GetBackend(*tx, backend_id);
    backend->status = v1::BACKEND_STATUS_READY;
    assert(repo.UpdateBackend(*tx, *backend));
    assert(repo.DeleteKeyLock(*tx, cluster, "rollback"));

    EventRecord event;
    event.kind         = "backend_status";
    event.key          = backend_id;
    event.payload_json = "{}";
    assert(repo.AppendEvent(*tx, event));
    // destroyed while open
  }

  auto tx = repo.Begin();
  assert(repo.GetBackend(*tx, backend_id)->status == v1::BACKEND_STATUS_SCHEDULED);
  assert(repo.GetKeyLock(*tx, cluster, "rollback")->backend_id == backend_id);
  assert(repo.GetMaxEventId(*tx) == max_event_before);
  tx->Commit();
}

void VerifyConcurrentLockWritesConflict(Repository& repo, const std::string& cluster, bool supports_parallel_transactions) {
  std::string backend_id = cluster + "-contended";
  {
    auto tx    = repo.Begin();
    auto drone = MakeDrone(cluster, "drone-contended");
    assert(repo.InsertDrone(*tx, drone));
    assert(repo.InsertBackend(*tx, MakeBackend(backend_id, cluster, drone.id)));
    tx->Commit();
  }

  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  // both see the key unheld and try to take it
  assert(!repo.GetKeyLock(*tx1, cluster, "contended").has_value());
  assert(!repo.GetKeyLock(*tx2, cluster, "contended").has_value());

  KeyLockRecord lock{cluster, "contended", backend_id, "t1", NowMs()};
  assert(repo.UpsertKeyLock(*tx1, lock));
  tx1->Commit();

  lock.tag   = "t2";
  bool threw = false;
  try {
    auto upsert = repo.UpsertKeyLock(*tx2, lock);
    if (!upsert) throw TransactionConflict(upsert.message);
    tx2->Commit();
  } catch (const TransactionConflict&) {
    threw = true;
  }
  assert(threw);

  auto verify = repo.Begin();
  assert(repo.GetKeyLock(*verify, cluster, "contended")->tag == "t1");
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& cluster) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo = backend.make_repository();
  uint64_t drone_id;
  uint64_t event_id;
  {
    auto tx    = repo->Begin();
    auto drone = MakeDrone(cluster, "drone-durable");
    assert(repo->InsertDrone(*tx, drone));
    drone_id = drone.id;

    assert(repo->InsertBackend(*tx, MakeBackend(cluster + "-durable", cluster, drone_id)));
    assert(repo->UpsertKeyLock(*tx, KeyLockRecord{cluster, "durable", cluster + "-durable", "t1", NowMs()}));

    EventRecord event;
    event.kind         = "key_acquired";
    event.key          = cluster + "-durable";
    event.payload_json = R"({"key":"durable"})";
    assert(repo->AppendEvent(*tx, event));
    event_id = event.id;

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetDrone(*tx, drone_id).has_value());
  assert(repo->GetBackend(*tx, cluster + "-durable").has_value());
  assert(repo->GetKeyLock(*tx, cluster, "durable")->tag == "t1");
  assert(repo->GetMaxEventId(*tx) >= event_id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      // transactions hold the repository mutex until they finish
      .supports_parallel_transactions = false,
  };
}

#if FLOTILLA_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("flotilla_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db   = std::make_shared<flotilla::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<flotilla::db::sqlite::SqliteRepository>(std::move(db));
    repo->BootstrapSchema();
    return repo;
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if FLOTILLA_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLOTILLA_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLOTILLA_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<flotilla::db::postgres::PgPool>(conninfo);
    auto repo = std::make_shared<flotilla::db::postgres::PgRepository>(std::move(pool));
    repo->BootstrapSchema();
    return repo;
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // a unique cluster per run keeps reruns against a shared database apart
  const auto cluster = backend.name + "-" + std::to_string(NowMs());

  VerifyDroneLifecycle(*repo, cluster);
  VerifyBackendsAndKeyLocks(*repo, cluster);
  VerifyEvents(*repo);
  VerifyRollbackBehavior(*repo, cluster);
  VerifyConcurrentLockWritesConflict(*repo, cluster, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, cluster);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FLOTILLA_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FLOTILLA_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "flotilla_integration_repository_parity: pass\n";
  return 0;
}
