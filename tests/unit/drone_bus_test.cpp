#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/bus/command_mailbox.hpp"
#include "internal/bus/local_drone_bus.hpp"
#include "internal/core/node_registry.hpp"
#include "internal/service/controller_service.hpp"
#include "internal/service/drone_bus_service.hpp"
#include "internal/util/errors.hpp"
#include "support/fleet_fixture.hpp"

namespace {

using namespace std::chrono_literals;
using flotilla::bus::CommandMailbox;
using flotilla::bus::LocalDroneBus;
using flotilla::testing::MakeConnect;
using flotilla::testing::MakeServiceContext;

namespace v1 = flotilla::v1;

v1::DroneCommand TerminateCommand(const std::string& backend_id) {
  v1::DroneCommand command;
  command.mutable_terminate()->set_backend_id(backend_id);
  command.mutable_terminate()->set_kind(v1::TERMINATION_KIND_SOFT);
  return command;
}

void TestMailboxOrderingAndRequeue() {
  CommandMailbox mailbox;
  assert(!mailbox.Dequeue(10ms).has_value());

  mailbox.Enqueue(TerminateCommand("a"));
  mailbox.Enqueue(TerminateCommand("b"));
  assert(mailbox.Size() == 2);

  auto first = mailbox.Dequeue(10ms);
  assert(first && first->terminate().backend_id() == "a");

  // an undelivered command goes back to the front
  mailbox.Requeue(*first);
  assert(mailbox.Dequeue(10ms)->terminate().backend_id() == "a");
  assert(mailbox.Dequeue(10ms)->terminate().backend_id() == "b");
}

void TestMailboxShutdownWakesWaiter() {
  CommandMailbox mailbox;

  std::thread waiter([&] { assert(!mailbox.Dequeue(10s).has_value()); });
  std::this_thread::sleep_for(20ms);
  mailbox.Shutdown();
  waiter.join();

  assert(mailbox.IsShutdown());
  mailbox.Enqueue(TerminateCommand("late"));
  assert(mailbox.Size() == 0);
}

void TestBusBuffersUntilAttach() {
  LocalDroneBus bus;

  v1::SpawnCommand spawn;
  spawn.set_backend_id("b1");
  bus.SendSpawn(7, spawn);
  bus.SendTerminate(7, TerminateCommand("b0").terminate());
  assert(bus.Pending(7) == 2);

  auto mailbox = bus.Attach(7);
  assert(mailbox->Size() == 2);
  assert(mailbox->Dequeue(10ms)->has_spawn());
  assert(mailbox->Dequeue(10ms)->has_terminate());
}

void TestSecondAttachTakesOver() {
  LocalDroneBus bus;

  auto first = bus.Attach(3);
  bus.SendTerminate(3, TerminateCommand("b1").terminate());

  auto second = bus.Attach(3);
  assert(first->IsShutdown());
  assert(!second->IsShutdown());
  assert(first->Size() == 0);
  assert(second->Size() == 1);

  bus.SendTerminate(3, TerminateCommand("b2").terminate());
  assert(second->Size() == 2);
}

void TestCloseAndShutdownDropCommands() {
  LocalDroneBus bus;

  auto mailbox = bus.Attach(4);
  bus.SendTerminate(4, TerminateCommand("b1").terminate());
  bus.CloseDrone(4);
  assert(mailbox->IsShutdown());
  assert(bus.Pending(4) == 0);

  bus.Shutdown();
  bus.SendTerminate(5, TerminateCommand("b2").terminate());
  assert(bus.Pending(5) == 0);
  assert(bus.Attach(5)->IsShutdown());
}

uint64_t RegisterDrone(flotilla::service::DroneBusService& drones, const std::string& cluster, const std::string& name) {
  v1::RegisterDroneRequest req;
  req.set_cluster(cluster);
  req.set_name(name);
  req.set_version("1.0.0");
  const auto id = drones.Register(req).drone_id();

  v1::DroneRef ref;
  ref.set_drone_id(id);
  drones.Heartbeat(ref);
  return id;
}

void TestAttachDeliversSpawnForConnect() {
  auto                                 ctx = MakeServiceContext();
  flotilla::service::DroneBusService   drones(ctx);
  flotilla::service::ControllerService controller(ctx);

  const auto drone_id = RegisterDrone(drones, "c1", "drone-a");
  const auto resp     = controller.Connect(MakeConnect("c1", "session", ""));
  assert(resp.spawned());

  v1::DroneRef ref;
  ref.set_drone_id(drone_id);

  std::vector<v1::DroneCommand> received;
  drones.Attach(
      ref,
      [&](const v1::DroneCommand& command) {
        received.push_back(command);
        return true;
      },
      [&] { return !received.empty(); });

  assert(received.size() == 1);
  assert(received[0].has_spawn());
  assert(received[0].spawn().backend_id() == resp.backend_id());
  assert(received[0].spawn().cluster() == "c1");
  assert(received[0].spawn().spawn_config().executable().image() == "ghcr.io/example/app:1");
}

void TestAttachReplaysScheduledSpawns() {
  auto                                 ctx = MakeServiceContext();
  flotilla::service::DroneBusService   drones(ctx);
  flotilla::service::ControllerService controller(ctx);

  const auto drone_id = RegisterDrone(drones, "c1", "drone-a");
  const auto resp     = controller.Connect(MakeConnect("c1", "", "", true));

  v1::DroneRef ref;
  ref.set_drone_id(drone_id);

  // the buffered spawn is lost by a dead stream
  drones.Attach(ref, [](const v1::DroneCommand&) { return false; }, [] { return false; });
  assert(ctx.bus->Pending(drone_id) >= 1);

  // drop what is queued; the backend is still Scheduled so Attach re-sends it
  ctx.bus->Attach(drone_id)->Drain();

  std::vector<v1::DroneCommand> received;
  drones.Attach(
      ref,
      [&](const v1::DroneCommand& command) {
        received.push_back(command);
        return true;
      },
      [&] { return !received.empty(); });
  assert(received.size() == 1);
  assert(received[0].spawn().backend_id() == resp.backend_id());

  // once the backend reports progress nothing is replayed
  v1::StatusReport report;
  report.set_backend_id(resp.backend_id());
  report.set_status(v1::BACKEND_STATUS_STARTING);
  drones.ReportStatus(report);

  ctx.bus->Attach(drone_id)->Drain();
  received.clear();
  drones.Attach(
      ref,
      [&](const v1::DroneCommand& command) {
        received.push_back(command);
        return true;
      },
      [] { return true; });
  assert(received.empty());
  assert(ctx.bus->Pending(drone_id) == 0);
}

void TestAttachRejectsUnknownAndTerminatedDrones() {
  auto                               ctx = MakeServiceContext();
  flotilla::service::DroneBusService drones(ctx);

  v1::DroneRef ref;
  ref.set_drone_id(424242);

  bool threw = false;
  try {
    drones.Attach(ref, [](const v1::DroneCommand&) { return true; }, [] { return true; });
  } catch (const flotilla::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  ref.set_drone_id(RegisterDrone(drones, "c1", "drone-a"));
  drones.Shutdown(ref);

  threw = false;
  try {
    drones.Attach(ref, [](const v1::DroneCommand&) { return true; }, [] { return true; });
  } catch (const flotilla::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestReattachEndsPreviousStream() {
  auto                               ctx = MakeServiceContext();
  flotilla::service::DroneBusService drones(ctx);

  const auto   drone_id = RegisterDrone(drones, "c1", "drone-a");
  v1::DroneRef ref;
  ref.set_drone_id(drone_id);

  ctx.bus->SendTerminate(drone_id, TerminateCommand("b1").terminate());

  std::atomic<bool> delivered{false};
  std::thread       first([&] {
    drones.Attach(
        ref,
        [&](const v1::DroneCommand&) {
          delivered = true;
          return true;
        },
        [] { return false; });
  });

  while (!delivered) {
    std::this_thread::sleep_for(5ms);
  }

  drones.Attach(ref, [](const v1::DroneCommand&) { return true; }, [] { return true; });
  first.join();
}

std::vector<v1::DroneCommand> AttachUntil(flotilla::service::DroneBusService& drones, uint64_t drone_id, std::size_t count) {
  v1::DroneRef ref;
  ref.set_drone_id(drone_id);

  std::vector<v1::DroneCommand> received;
  drones.Attach(
      ref,
      [&](const v1::DroneCommand& command) {
        received.push_back(command);
        return true;
      },
      [&] { return received.size() >= count; });
  return received;
}

void TestAttachOnRestartedControllerRebuildsTerminates() {
  auto                                 before = MakeServiceContext();
  flotilla::service::DroneBusService   drones(before);
  flotilla::service::ControllerService controller(before);

  const auto drone_id = RegisterDrone(drones, "c1", "drone-a");
  const auto resp     = controller.Connect(MakeConnect("c1", "session", ""));

  v1::StatusReport report;
  report.set_backend_id(resp.backend_id());
  report.set_status(v1::BACKEND_STATUS_READY);
  drones.ReportStatus(report);

  v1::TerminateRequest terminate;
  terminate.set_backend_id(resp.backend_id());
  terminate.set_kind(v1::TERMINATION_KIND_SOFT);
  controller.Terminate(terminate);
  assert(before.bus->Pending(drone_id) >= 1);

  // a new controller over the same store has an empty bus
  auto                               after = MakeServiceContext("", before.repository);
  flotilla::service::DroneBusService restarted(after);
  assert(after.bus->Pending(drone_id) == 0);

  auto received = AttachUntil(restarted, drone_id, 1);
  assert(received.size() == 1);
  assert(received[0].has_terminate());
  assert(received[0].terminate().backend_id() == resp.backend_id());
  assert(received[0].terminate().kind() == v1::TERMINATION_KIND_SOFT);

  // escalation recorded elsewhere is rebuilt as a hard terminate
  terminate.set_kind(v1::TERMINATION_KIND_HARD);
  controller.Terminate(terminate);

  received = AttachUntil(restarted, drone_id, 1);
  assert(received.size() == 1);
  assert(received[0].terminate().kind() == v1::TERMINATION_KIND_HARD);

  // nothing is rebuilt once the drone reports Terminated
  report.set_status(v1::BACKEND_STATUS_TERMINATED);
  restarted.ReportStatus(report);

  v1::DroneRef ref;
  ref.set_drone_id(drone_id);
  received.clear();
  std::atomic<int> polls{0};
  restarted.Attach(
      ref,
      [&](const v1::DroneCommand& command) {
        received.push_back(command);
        return true;
      },
      [&] { return ++polls > 2; });
  assert(received.empty());
}

void TestAttachSendsEachCommandOncePerStream() {
  auto                                 ctx = MakeServiceContext();
  flotilla::service::DroneBusService   drones(ctx);
  flotilla::service::ControllerService controller(ctx);

  const auto drone_id = RegisterDrone(drones, "c1", "drone-a");
  const auto resp     = controller.Connect(MakeConnect("c1", "", ""));

  // the spawn sits both in the mailbox and in the store
  assert(ctx.bus->Pending(drone_id) == 1);

  v1::DroneRef ref;
  ref.set_drone_id(drone_id);
  std::vector<v1::DroneCommand> received;
  std::atomic<int>              polls{0};
  drones.Attach(
      ref,
      [&](const v1::DroneCommand& command) {
        received.push_back(command);
        return true;
      },
      [&] { return ++polls > 3; });

  assert(received.size() == 1);
  assert(received[0].spawn().backend_id() == resp.backend_id());
  assert(ctx.bus->Pending(drone_id) == 0);
}

} // namespace

int main() {
  TestMailboxOrderingAndRequeue();
  TestMailboxShutdownWakesWaiter();
  TestBusBuffersUntilAttach();
  TestSecondAttachTakesOver();
  TestCloseAndShutdownDropCommands();
  TestAttachDeliversSpawnForConnect();
  TestAttachReplaysScheduledSpawns();
  TestAttachRejectsUnknownAndTerminatedDrones();
  TestReattachEndsPreviousStream();
  TestAttachOnRestartedControllerRebuildsTerminates();
  TestAttachSendsEachCommandOncePerStream();

  std::cout << "flotilla_unit_drone_bus: pass\n";
  return 0;
}
