#include "placement_engine.hpp"

#include "internal/model/backend_state_machine.hpp"

namespace flotilla::core {

bool PlacementEngine::IsEligible(const db::model::DroneRecord& drone, const std::string& cluster, uint64_t as_of_ms, uint64_t staleness_ms) {
  if (drone.cluster != cluster) return false;
  if (drone.status != flotilla::v1::DRONE_STATUS_AVAILABLE) return false;
  if (drone.draining) return false;

  // a heartbeat stamped after as_of (clock skew) counts as fresh
  if (drone.last_heartbeat_ms >= as_of_ms) return true;
  return as_of_ms - drone.last_heartbeat_ms <= staleness_ms;
}

std::optional<db::model::DroneRecord> PlacementEngine::SelectDrone(const std::vector<db::model::DroneRecord>& drones,
                                                                   const std::unordered_map<uint64_t, uint64_t>& live_backends,
                                                                   const std::string& cluster, uint64_t as_of_ms, uint64_t staleness_ms) {
  const db::model::DroneRecord* best      = nullptr;
  uint64_t                      best_load = 0;

  for (const auto& drone : drones) {
    if (!IsEligible(drone, cluster, as_of_ms, staleness_ms)) continue;

    const auto it   = live_backends.find(drone.id);
    const auto load = it == live_backends.end() ? 0 : it->second;
    if (!best || load < best_load || (load == best_load && drone.id < best->id)) {
      best      = &drone;
      best_load = load;
    }
  }

  if (!best) return std::nullopt;
  return *best;
}

std::optional<db::model::DroneRecord> PlacementEngine::SelectDrone(db::Repository& repository, db::Transaction& tx, const std::string& cluster,
                                                                   uint64_t as_of_ms, uint64_t staleness_ms) {
  db::DroneFilter drone_filter;
  drone_filter.cluster            = cluster;
  drone_filter.include_terminated = false;
  auto drones                     = repository.ListDrones(tx, drone_filter);

  db::BackendFilter backend_filter;
  backend_filter.cluster            = cluster;
  backend_filter.include_terminated = false;
  auto live = CountLiveBackends(repository.ListBackends(tx, backend_filter));

  return SelectDrone(drones, live, cluster, as_of_ms, staleness_ms);
}

std::unordered_map<uint64_t, uint64_t> PlacementEngine::CountLiveBackends(const std::vector<db::model::BackendRecord>& backends) {
  std::unordered_map<uint64_t, uint64_t> counts;
  for (const auto& backend : backends) {
    if (model::IsLive(backend.status)) {
      ++counts[backend.drone_id];
    }
  }
  return counts;
}

} // namespace flotilla::core
