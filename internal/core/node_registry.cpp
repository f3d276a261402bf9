#include "node_registry.hpp"

#include <stdexcept>
#include <unordered_map>

#include "backend_registry.hpp"
#include "placement_engine.hpp"
#include "internal/bus/drone_bus.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/backend_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flotilla::core {

namespace {

bool IsTerminated(const db::model::DroneRecord& drone) {
  return drone.status == flotilla::v1::DRONE_STATUS_TERMINATED;
}

void AppendDroneEvent(events::EventLog& events, db::Transaction& tx, std::string_view kind, const db::model::DroneRecord& drone) {
  events.Append(tx, kind, NodeRegistry::EventKey(drone.id), NodeRegistry::ToProto(drone, 0));
}

} // namespace

NodeRegistry::NodeRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::shared_ptr<bus::DroneBus> bus,
                           std::string controller_id, uint64_t staleness_ms)
    : repository_(std::move(repository)),
      events_(std::move(events)),
      bus_(std::move(bus)),
      controller_id_(std::move(controller_id)),
      staleness_ms_(staleness_ms) {
}

std::string NodeRegistry::EventKey(uint64_t drone_id) {
  return "drone-" + std::to_string(drone_id);
}

bool NodeRegistry::IsStale(const db::model::DroneRecord& drone, uint64_t as_of_ms) const {
  if (IsTerminated(drone) || as_of_ms <= drone.last_heartbeat_ms) return false;
  return as_of_ms - drone.last_heartbeat_ms > staleness_ms_;
}

db::model::DroneRecord NodeRegistry::Register(const RegisterDroneParams& params, uint64_t now_ms) {
  if (params.cluster.empty() || params.name.empty()) {
    throw std::invalid_argument("drone registration requires cluster and name");
  }

  db::model::DroneRecord                previous;
  std::vector<db::model::BackendRecord> orphans;

  auto tx       = repository_->Begin();
  auto existing = repository_->GetLiveDroneByName(*tx, params.cluster, params.name);
  if (existing) {
    previous = *existing;
    orphans  = TerminateInTx(*tx, previous);
  }

  db::model::DroneRecord drone;
  drone.cluster           = params.cluster;
  drone.name              = params.name;
  drone.controller        = controller_id_;
  drone.version           = params.version;
  drone.build_hash        = params.build_hash;
  drone.status            = flotilla::v1::DRONE_STATUS_STARTING;
  drone.last_heartbeat_ms = now_ms;
  db::ThrowIfError(repository_->InsertDrone(*tx, drone), "insert drone");
  AppendDroneEvent(*events_, *tx, events::kind::kDroneStatus, drone);

  tx->Commit();
  events_->NotifyCommitted();

  if (existing) {
    FLOTILLA_LOG_INFO("drone re-registered, previous instance terminated",
                      {observability::StringField("cluster", drone.cluster), observability::StringField("name", drone.name),
                       observability::UintField("previous_id", previous.id)});
    ReportOrphans(previous, orphans);
  }

  FLOTILLA_LOG_INFO("drone registered", {observability::UintField("drone_id", drone.id), observability::StringField("cluster", drone.cluster),
                                         observability::StringField("name", drone.name), observability::StringField("version", drone.version)});
  return drone;
}

void NodeRegistry::Heartbeat(uint64_t drone_id, uint64_t now_ms) {
  auto tx    = repository_->Begin();
  auto drone = repository_->GetDrone(*tx, drone_id);
  if (!drone) {
    throw util::NotFound("drone " + std::to_string(drone_id) + " not found");
  }
  if (IsTerminated(*drone)) {
    throw util::InvalidState("drone " + std::to_string(drone_id) + " is terminated");
  }

  const bool promoted = drone->status == flotilla::v1::DRONE_STATUS_STARTING;
  if (promoted) {
    drone->status = flotilla::v1::DRONE_STATUS_AVAILABLE;
  }
  if (now_ms > drone->last_heartbeat_ms) {
    drone->last_heartbeat_ms = now_ms;
  }

  db::ThrowIfError(repository_->UpdateDrone(*tx, *drone), "update drone heartbeat");
  if (promoted) {
    AppendDroneEvent(*events_, *tx, events::kind::kDroneStatus, *drone);
  }
  tx->Commit();

  if (promoted) {
    events_->NotifyCommitted();
    FLOTILLA_LOG_INFO("drone available", {observability::UintField("drone_id", drone_id), observability::StringField("cluster", drone->cluster)});
  }
}

std::vector<db::model::BackendRecord> NodeRegistry::Shutdown(uint64_t drone_id) {
  auto tx    = repository_->Begin();
  auto drone = repository_->GetDrone(*tx, drone_id);
  if (!drone) {
    throw util::NotFound("drone " + std::to_string(drone_id) + " not found");
  }
  if (IsTerminated(*drone)) {
    tx->Commit();
    return {};
  }

  auto orphans = TerminateInTx(*tx, *drone);
  tx->Commit();
  events_->NotifyCommitted();

  FLOTILLA_LOG_INFO("drone shut down", {observability::UintField("drone_id", drone_id), observability::StringField("cluster", drone->cluster)});
  ReportOrphans(*drone, orphans);
  return orphans;
}

void NodeRegistry::Drain(const std::string& cluster, const std::string& name) {
  auto tx    = repository_->Begin();
  auto drone = repository_->GetLiveDroneByName(*tx, cluster, name);
  if (!drone) {
    throw util::NotFound("no live drone '" + name + "' in cluster '" + cluster + "'");
  }
  if (drone->draining) {
    tx->Commit();
    return;
  }

  drone->draining = true;
  db::ThrowIfError(repository_->UpdateDrone(*tx, *drone), "update drone drain");
  AppendDroneEvent(*events_, *tx, events::kind::kDroneDrain, *drone);
  tx->Commit();
  events_->NotifyCommitted();

  FLOTILLA_LOG_INFO("drone draining", {observability::UintField("drone_id", drone->id), observability::StringField("cluster", cluster),
                                       observability::StringField("name", name)});
}

std::vector<db::model::BackendRecord> NodeRegistry::SweepStale(uint64_t as_of_ms) {
  std::vector<db::model::DroneRecord> stale;
  {
    db::DroneFilter filter;
    filter.include_terminated = false;

    auto tx = repository_->Begin();
    for (auto& drone : repository_->ListDrones(*tx, filter)) {
      if (IsStale(drone, as_of_ms)) stale.push_back(std::move(drone));
    }
    tx->Commit();
  }

  std::vector<db::model::BackendRecord> all_orphans;
  for (const auto& candidate : stale) {
    try {
      auto tx    = repository_->Begin();
      auto drone = repository_->GetDrone(*tx, candidate.id);
      // Re-checked: a heartbeat may have landed since the listing.
      if (!drone || !IsStale(*drone, as_of_ms)) {
        tx->Commit();
        continue;
      }

      auto orphans = TerminateInTx(*tx, *drone);
      tx->Commit();
      events_->NotifyCommitted();

      FLOTILLA_LOG_WARN("drone missed heartbeat window, terminated",
                        {observability::UintField("drone_id", drone->id), observability::StringField("cluster", drone->cluster),
                         observability::UintField("last_heartbeat_ms", drone->last_heartbeat_ms)});
      ReportOrphans(*drone, orphans);
      all_orphans.insert(all_orphans.end(), orphans.begin(), orphans.end());
    } catch (const std::exception& e) {
      FLOTILLA_LOG_ERROR("drone sweep failed", {observability::UintField("drone_id", candidate.id), observability::StringField("error", e.what())});
    }
  }
  return all_orphans;
}

std::vector<db::model::BackendRecord> NodeRegistry::TerminateInTx(db::Transaction& tx, db::model::DroneRecord& drone) {
  drone.status = flotilla::v1::DRONE_STATUS_TERMINATED;
  db::ThrowIfError(repository_->UpdateDrone(tx, drone), "terminate drone");
  AppendDroneEvent(*events_, tx, events::kind::kDroneStatus, drone);

  db::BackendFilter filter;
  filter.drone_id           = drone.id;
  filter.include_terminated = false;

  auto orphans = repository_->ListBackends(tx, filter);
  for (const auto& backend : orphans) {
    flotilla::v1::BackendOrphaned payload;
    payload.set_backend_id(backend.id);
    payload.set_cluster(backend.cluster);
    payload.set_drone_id(drone.id);
    payload.set_status(backend.status);
    events_->Append(tx, events::kind::kBackendOrphaned, backend.id, payload);
  }
  return orphans;
}

void NodeRegistry::ReportOrphans(const db::model::DroneRecord& drone, const std::vector<db::model::BackendRecord>& orphans) {
  bus_->CloseDrone(drone.id);
  if (orphans.empty()) return;

  for (const auto& backend : orphans) {
    FLOTILLA_LOG_WARN("backend orphaned by terminated drone",
                      {observability::StringField("backend_id", backend.id), observability::UintField("drone_id", drone.id),
                       observability::StringField("cluster", drone.cluster),
                       observability::StringField("status", flotilla::v1::BackendStatus_Name(backend.status))});
  }
  observability::Metrics::Instance().RecordOrphanedBackends(drone.cluster, orphans.size());
}

std::vector<flotilla::v1::DroneInfo> NodeRegistry::List(const db::DroneFilter& filter) {
  auto tx     = repository_->Begin();
  auto drones = repository_->ListDrones(*tx, filter);

  db::BackendFilter backend_filter;
  backend_filter.cluster            = filter.cluster;
  backend_filter.include_terminated = false;
  const auto live = PlacementEngine::CountLiveBackends(repository_->ListBackends(*tx, backend_filter));
  tx->Commit();

  std::vector<flotilla::v1::DroneInfo> out;
  out.reserve(drones.size());
  for (const auto& drone : drones) {
    const auto it = live.find(drone.id);
    out.push_back(ToProto(drone, it == live.end() ? 0 : it->second));
  }
  return out;
}

std::vector<flotilla::v1::BackendInfo> NodeRegistry::ListBackends(const db::BackendFilter& filter) {
  auto tx       = repository_->Begin();
  auto backends = repository_->ListBackends(*tx, filter);

  std::unordered_map<uint64_t, bool> drone_terminated;
  for (const auto& backend : backends) {
    if (drone_terminated.contains(backend.drone_id)) continue;
    auto drone                         = repository_->GetDrone(*tx, backend.drone_id);
    drone_terminated[backend.drone_id] = !drone || IsTerminated(*drone);
  }
  tx->Commit();

  std::vector<flotilla::v1::BackendInfo> out;
  out.reserve(backends.size());
  for (const auto& backend : backends) {
    const bool orphaned = model::IsLive(backend.status) && drone_terminated[backend.drone_id];
    out.push_back(BackendRegistry::ToProto(backend, orphaned));
  }
  return out;
}

flotilla::v1::DroneInfo NodeRegistry::ToProto(const db::model::DroneRecord& record, uint64_t live_backends) {
  flotilla::v1::DroneInfo info;
  info.set_id(record.id);
  info.set_cluster(record.cluster);
  info.set_name(record.name);
  info.set_controller(record.controller);
  info.set_version(record.version);
  info.set_build_hash(record.build_hash);
  info.set_status(record.status);
  *info.mutable_last_heartbeat() = util::MillisToProto(record.last_heartbeat_ms);
  info.set_draining(record.draining);
  info.set_live_backends(live_backends);
  return info;
}

} // namespace flotilla::core
