#include "connect_protocol.hpp"

#include "backend_registry.hpp"
#include "placement_engine.hpp"
#include "internal/bus/drone_bus.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/events/event_log.hpp"
#include "internal/lock/key_lock_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace flotilla::core {

namespace {

std::string_view OutcomeOf(const util::ConnectError& e) {
  if (dynamic_cast<const util::NoClusterProvided*>(&e)) return "no_cluster_provided";
  if (dynamic_cast<const util::KeyUnheldNoSpawnConfig*>(&e)) return "key_unheld_no_spawn_config";
  if (dynamic_cast<const util::KeyHeld*>(&e)) return "key_held";
  if (dynamic_cast<const util::KeyHeldUnhealthy*>(&e)) return "key_held_unhealthy";
  if (dynamic_cast<const util::NoDroneAvailable*>(&e)) return "no_drone_available";
  if (dynamic_cast<const util::FailedToAcquireKey*>(&e)) return "failed_to_acquire_key";
  return "error";
}

} // namespace

ConnectProtocol::ConnectProtocol(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events,
                                 std::shared_ptr<lock::KeyLockTable> locks, std::shared_ptr<BackendRegistry> backends,
                                 std::shared_ptr<bus::DroneBus> bus, ConnectSettings settings)
    : repository_(std::move(repository)),
      events_(std::move(events)),
      locks_(std::move(locks)),
      backends_(std::move(backends)),
      bus_(std::move(bus)),
      settings_(std::move(settings)) {
}

std::string ConnectProtocol::BackendUrl(const std::string& backend_id, const std::string& cluster) const {
  return settings_.url_scheme + "://" + backend_id + "." + cluster + "/";
}

flotilla::v1::ConnectResponse ConnectProtocol::Connect(const flotilla::v1::ConnectRequest& request, uint64_t now_ms) {
  const std::string cluster = request.cluster().empty() ? settings_.default_cluster : request.cluster();

  flotilla::v1::ConnectResponse response;
  flotilla::v1::SpawnCommand    spawn;
  try {
    if (cluster.empty()) {
      throw util::NoClusterProvided();
    }

    auto tx  = repository_->Begin();
    response = ConnectInTx(*tx, cluster, request, now_ms, spawn);
    tx->Commit();
  } catch (const db::TransactionConflict& e) {
    FLOTILLA_LOG_WARN("connect lost a concurrent transaction", {observability::StringField("cluster", cluster),
                                                               observability::StringField("key", request.key().name()),
                                                               observability::StringField("error", e.what())});
    observability::Metrics::Instance().RecordConnectOutcome(cluster, "failed_to_acquire_key");
    throw util::FailedToAcquireKey();
  } catch (const util::ConnectError& e) {
    observability::Metrics::Instance().RecordConnectOutcome(cluster, OutcomeOf(e));
    throw;
  }

  if (!response.spawned()) {
    observability::Metrics::Instance().RecordConnectOutcome(cluster, "existing");
    return response;
  }

  events_->NotifyCommitted();
  bus_->SendSpawn(response.drone_id(), spawn);
  observability::Metrics::Instance().RecordConnectOutcome(cluster, "spawned");

  FLOTILLA_LOG_INFO("backend spawned", {observability::StringField("backend_id", response.backend_id()),
                                        observability::StringField("cluster", cluster), observability::UintField("drone_id", response.drone_id()),
                                        observability::StringField("key", request.key().name())});
  return response;
}

flotilla::v1::ConnectResponse ConnectProtocol::ConnectInTx(db::Transaction& tx, const std::string& cluster, const flotilla::v1::ConnectRequest& request,
                                                           uint64_t now_ms, flotilla::v1::SpawnCommand& spawn) {
  const bool               has_key = request.has_key() && !request.key().name().empty();
  const std::string        key     = has_key ? request.key().name() : std::string();
  const std::string&       tag     = request.key().tag();
  flotilla::v1::ConnectResponse response;

  if (has_key) {
    const auto view = locks_->Inspect(tx, cluster, key);
    switch (view.state) {
      case lock::KeyLockState::kHeldHealthy:
        if (!tag.empty() && tag != view.lock->tag) {
          throw util::KeyHeld(key, view.lock->tag);
        }
        response.set_backend_id(view.holder->id);
        response.set_spawned(false);
        response.set_url(BackendUrl(view.holder->id, cluster));
        response.set_drone_id(view.holder->drone_id);
        response.set_status(view.holder->status);
        return response;
      case lock::KeyLockState::kHeldUnhealthy:
        throw util::KeyHeldUnhealthy(key);
      case lock::KeyLockState::kUnheld:
        break;
    }
  }

  if (!request.has_spawn_config()) {
    throw util::KeyUnheldNoSpawnConfig(key);
  }

  const auto drone = PlacementEngine::SelectDrone(*repository_, tx, cluster, now_ms, settings_.staleness_ms);
  if (!drone) {
    throw util::NoDroneAvailable(cluster);
  }

  const auto backend = backends_->Create(tx, cluster, drone->id, request.spawn_config(), key, now_ms);
  if (has_key) {
    locks_->Bind(tx, cluster, key, backend.id, tag.empty() ? lock::KeyLockTable::GenerateTag() : tag, now_ms);
  }

  spawn.set_backend_id(backend.id);
  spawn.set_cluster(cluster);
  spawn.set_drone_id(drone->id);
  *spawn.mutable_spawn_config() = request.spawn_config();

  response.set_backend_id(backend.id);
  response.set_spawned(true);
  response.set_url(BackendUrl(backend.id, cluster));
  response.set_drone_id(drone->id);
  response.set_status(backend.status);
  return response;
}

} // namespace flotilla::core
