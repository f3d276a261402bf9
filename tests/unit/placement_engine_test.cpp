#include <cassert>
#include <iostream>
#include <unordered_map>
#include <vector>

#include "internal/core/placement_engine.hpp"

namespace {

using flotilla::core::PlacementEngine;
using flotilla::db::model::BackendRecord;
using flotilla::db::model::DroneRecord;
using namespace flotilla::v1;

constexpr uint64_t kNow       = 1'000'000;
constexpr uint64_t kStaleness = 30'000;

DroneRecord Drone(uint64_t id, const std::string& cluster, DroneStatus status = DRONE_STATUS_AVAILABLE, uint64_t heartbeat = kNow) {
  DroneRecord d;
  d.id                = id;
  d.cluster           = cluster;
  d.name              = "drone-" + std::to_string(id);
  d.status            = status;
  d.last_heartbeat_ms = heartbeat;
  return d;
}

void TestLeastLoadedWinsAndTiesGoToSmallestId() {
  std::vector<DroneRecord>               drones{Drone(3, "c1"), Drone(1, "c1"), Drone(2, "c1")};
  std::unordered_map<uint64_t, uint64_t> load{{1, 2}, {2, 1}, {3, 1}};

  auto selected = PlacementEngine::SelectDrone(drones, load, "c1", kNow, kStaleness);
  assert(selected.has_value());
  assert(selected->id == 2);

  load[2] = 5;
  selected = PlacementEngine::SelectDrone(drones, load, "c1", kNow, kStaleness);
  assert(selected->id == 3);
}

void TestIneligibleDronesAreSkipped() {
  auto draining     = Drone(1, "c1");
  draining.draining = true;

  std::vector<DroneRecord> drones{draining,
                                  Drone(2, "c1", DRONE_STATUS_STARTING),
                                  Drone(3, "c1", DRONE_STATUS_TERMINATED),
                                  Drone(4, "c2"),
                                  Drone(5, "c1", DRONE_STATUS_AVAILABLE, kNow - kStaleness - 1)};

  assert(!PlacementEngine::SelectDrone(drones, {}, "c1", kNow, kStaleness).has_value());

  drones.push_back(Drone(6, "c1", DRONE_STATUS_AVAILABLE, kNow - kStaleness));
  auto selected = PlacementEngine::SelectDrone(drones, {}, "c1", kNow, kStaleness);
  assert(selected.has_value() && selected->id == 6);
}

void TestHeartbeatAheadOfClockCountsAsFresh() {
  assert(PlacementEngine::IsEligible(Drone(1, "c1", DRONE_STATUS_AVAILABLE, kNow + 5'000), "c1", kNow, kStaleness));
}

void TestCountLiveBackendsIgnoresTerminated() {
  std::vector<BackendRecord> backends(4);
  backends[0].drone_id = 1;
  backends[0].status   = BACKEND_STATUS_READY;
  backends[1].drone_id = 1;
  backends[1].status   = BACKEND_STATUS_TERMINATED;
  backends[2].drone_id = 2;
  backends[2].status   = BACKEND_STATUS_TERMINATING;
  backends[3].drone_id = 1;
  backends[3].status   = BACKEND_STATUS_SCHEDULED;

  auto counts = PlacementEngine::CountLiveBackends(backends);
  assert(counts[1] == 2);
  assert(counts[2] == 1);
}

} // namespace

int main() {
  TestLeastLoadedWinsAndTiesGoToSmallestId();
  TestIneligibleDronesAreSkipped();
  TestHeartbeatAheadOfClockCountsAsFresh();
  TestCountLiveBackendsIgnoresTerminated();

  std::cout << "flotilla_unit_placement_engine: pass\n";
  return 0;
}
