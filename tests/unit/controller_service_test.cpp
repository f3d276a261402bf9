#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/events/event_log.hpp"
#include "internal/service/controller_service.hpp"
#include "internal/service/drone_bus_service.hpp"
#include "internal/util/errors.hpp"
#include "support/fleet_fixture.hpp"

namespace {

using namespace std::chrono_literals;
using flotilla::service::ControllerService;
using flotilla::service::DroneBusService;
using flotilla::testing::MakeConnect;
using flotilla::testing::MakeServiceContext;

namespace v1 = flotilla::v1;

struct Harness {
  explicit Harness(const std::string& default_cluster = "") : ctx(MakeServiceContext(default_cluster)), controller(ctx), drones(ctx) {
  }

  uint64_t AddDrone(const std::string& cluster, const std::string& name) {
    v1::RegisterDroneRequest req;
    req.set_cluster(cluster);
    req.set_name(name);
    const auto id = drones.Register(req).drone_id();

    v1::DroneRef ref;
    ref.set_drone_id(id);
    drones.Heartbeat(ref);
    return id;
  }

  void Report(const std::string& backend_id, v1::BackendStatus status) {
    v1::StatusReport report;
    report.set_backend_id(backend_id);
    report.set_status(status);
    drones.ReportStatus(report);
  }

  flotilla::service::ServiceContext ctx;
  ControllerService                 controller;
  DroneBusService                   drones;
};

void TestWatchBackendFollowsLifecycle() {
  Harness h;
  h.AddDrone("c1", "drone-a");
  const auto backend_id = h.controller.Connect(MakeConnect("c1", "session", "")).backend_id();

  std::mutex                       mutex;
  std::vector<v1::BackendStatus>   seen;
  std::atomic<bool>                first_sent{false};

  v1::WatchBackendRequest req;
  req.set_backend_id(backend_id);

  std::thread watcher([&] {
    h.controller.WatchBackend(
        req,
        [&](const v1::BackendStatusUpdate& update) {
          assert(update.backend_id() == backend_id);
          std::lock_guard lock(mutex);
          seen.push_back(update.status());
          first_sent = true;
          return true;
        },
        [] { return false; });
  });

  while (!first_sent) {
    std::this_thread::sleep_for(5ms);
  }

  h.Report(backend_id, v1::BACKEND_STATUS_STARTING);
  h.Report(backend_id, v1::BACKEND_STATUS_READY);
  // a late report never moves the status backwards
  h.Report(backend_id, v1::BACKEND_STATUS_STARTING);

  v1::TerminateRequest terminate;
  terminate.set_backend_id(backend_id);
  h.controller.Terminate(terminate);
  h.Report(backend_id, v1::BACKEND_STATUS_TERMINATED);

  // the stream ends on its own after Terminated
  watcher.join();

  const std::vector<v1::BackendStatus> expected = {v1::BACKEND_STATUS_SCHEDULED, v1::BACKEND_STATUS_STARTING, v1::BACKEND_STATUS_READY,
                                                   v1::BACKEND_STATUS_TERMINATING, v1::BACKEND_STATUS_TERMINATED};
  assert(seen == expected);
}

void TestWatchBackendOnTerminatedBackendSendsOnce() {
  Harness h;
  h.AddDrone("c1", "drone-a");
  const auto backend_id = h.controller.Connect(MakeConnect("c1", "", "")).backend_id();
  h.Report(backend_id, v1::BACKEND_STATUS_TERMINATED);

  v1::WatchBackendRequest req;
  req.set_backend_id(backend_id);

  std::vector<v1::BackendStatus> seen;
  h.controller.WatchBackend(
      req,
      [&](const v1::BackendStatusUpdate& update) {
        seen.push_back(update.status());
        return true;
      },
      [] { return false; });
  assert(seen.size() == 1);
  assert(seen[0] == v1::BACKEND_STATUS_TERMINATED);

  req.set_backend_id("missing");
  bool threw = false;
  try {
    h.controller.WatchBackend(req, [](const v1::BackendStatusUpdate&) { return true; }, [] { return false; });
  } catch (const flotilla::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestWatchEventsReplaysFromCursor() {
  Harness h;
  h.AddDrone("c1", "drone-a");
  h.controller.Connect(MakeConnect("c1", "session", ""));

  std::vector<v1::Event> all;
  v1::WatchEventsRequest req;
  h.controller.WatchEvents(
      req,
      [&](const v1::Event& event) {
        all.push_back(event);
        return true;
      },
      [&] { return all.size() >= 4; });

  // register, available, backend scheduled, key acquired
  assert(all.size() == 4);
  assert(all[0].kind() == flotilla::events::kind::kDroneStatus);
  assert(all[1].kind() == flotilla::events::kind::kDroneStatus);
  assert(all[2].kind() == flotilla::events::kind::kBackendStatus);
  assert(all[3].kind() == flotilla::events::kind::kKeyAcquired);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i].id() > all[i - 1].id());
  }

  v1::ReleaseKeyRequest release;
  release.set_cluster("c1");
  release.set_key("session");
  h.controller.ReleaseKey(release);

  std::vector<v1::Event> tail;
  req.set_after_id(all.back().id());
  h.controller.WatchEvents(
      req,
      [&](const v1::Event& event) {
        tail.push_back(event);
        return true;
      },
      [&] { return !tail.empty(); });
  assert(tail.size() == 1);
  assert(tail[0].kind() == flotilla::events::kind::kKeyReleased);
  assert(tail[0].payload_json().find("\"key\":\"session\"") != std::string::npos);
}

void TestWatchEventsFromLatestSkipsHistory() {
  Harness h;
  h.AddDrone("c1", "drone-a");

  v1::WatchEventsRequest req;
  req.set_from_latest(true);

  int  polls     = 0;
  bool delivered = false;
  h.controller.WatchEvents(
      req,
      [&](const v1::Event&) {
        delivered = true;
        return true;
      },
      [&] { return polls++ >= 1; });
  assert(!delivered);
}

void TestListingsReflectFleet() {
  Harness    h("c1");
  const auto drone_a = h.AddDrone("c1", "drone-a");
  h.AddDrone("c2", "drone-b");

  const auto first  = h.controller.Connect(MakeConnect("", "k1", ""));
  const auto second = h.controller.Connect(MakeConnect("", "k2", ""));
  assert(first.drone_id() == drone_a);
  assert(second.drone_id() == drone_a);

  v1::ListDronesRequest drones_req;
  drones_req.set_cluster("c1");
  auto drones = h.controller.ListDrones(drones_req);
  assert(drones.drones_size() == 1);
  assert(drones.drones(0).name() == "drone-a");
  assert(drones.drones(0).status() == v1::DRONE_STATUS_AVAILABLE);
  assert(drones.drones(0).controller() == "controller-test");
  assert(drones.drones(0).live_backends() == 2);

  assert(h.controller.ListDrones(v1::ListDronesRequest{}).drones_size() == 2);

  // the drone goes away: its backends are reported orphaned
  v1::DroneRef ref;
  ref.set_drone_id(drone_a);
  h.drones.Shutdown(ref);

  v1::ListBackendsRequest backends_req;
  backends_req.set_cluster("c1");
  auto backends = h.controller.ListBackends(backends_req);
  assert(backends.backends_size() == 2);
  for (const auto& backend : backends.backends()) {
    assert(backend.orphaned());
    assert(backend.cluster() == "c1");
  }

  assert(h.controller.ListDrones(drones_req).drones_size() == 0);
  drones_req.set_include_terminated(true);
  assert(h.controller.ListDrones(drones_req).drones_size() == 1);
}

void TestTerminationCandidatesValidatesFilter() {
  Harness h;
  h.AddDrone("c1", "drone-a");
  h.controller.Connect(MakeConnect("c1", "", ""));

  v1::TerminationCandidatesRequest req;
  assert(h.controller.TerminationCandidates(req).candidates_size() == 0);

  req.set_drone("drone-a");
  bool threw = false;
  try {
    h.controller.TerminationCandidates(req);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  req.set_cluster("c1");
  req.set_drone("ghost");
  threw = false;
  try {
    h.controller.TerminationCandidates(req);
  } catch (const flotilla::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestDrainRequiresCluster() {
  Harness h;
  h.AddDrone("c1", "drone-a");

  v1::DrainRequest req;
  req.set_drone("drone-a");
  bool threw = false;
  try {
    h.controller.Drain(req);
  } catch (const flotilla::util::NoClusterProvided&) {
    threw = true;
  }
  assert(threw);

  req.set_cluster("c1");
  h.controller.Drain(req);
  h.controller.Drain(req);

  // drained drones take no new backends
  threw = false;
  try {
    h.controller.Connect(MakeConnect("c1", "", ""));
  } catch (const flotilla::util::NoDroneAvailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWatchBackendFollowsLifecycle();
  TestWatchBackendOnTerminatedBackendSendsOnce();
  TestWatchEventsReplaysFromCursor();
  TestWatchEventsFromLatestSkipsHistory();
  TestListingsReflectFleet();
  TestTerminationCandidatesValidatesFilter();
  TestDrainRequiresCluster();

  std::cout << "flotilla_unit_controller_service: pass\n";
  return 0;
}
