#include <cassert>
#include <iostream>

#include "support/fleet_fixture.hpp"

namespace {

using namespace flotilla::v1;
using flotilla::core::TerminationWatchdog;
using flotilla::db::model::BackendRecord;
using flotilla::testing::Fleet;
using flotilla::testing::kT0;
using flotilla::testing::MakeSpawnConfig;

BackendRecord Backend(BackendStatus status, uint64_t keepalive_ms) {
  BackendRecord b;
  b.id                = "b1";
  b.status            = status;
  b.last_keepalive_ms = keepalive_ms;
  return b;
}

std::string Spawn(Fleet& fleet, const SpawnConfig& config) {
  ConnectRequest req;
  req.set_cluster("c1");
  *req.mutable_spawn_config() = config;
  return fleet.connect->Connect(req, kT0).backend_id();
}

void TestIdleBoundaryIsStrict() {
  auto b                 = Backend(BACKEND_STATUS_READY, kT0);
  b.allowed_idle_seconds = 60;

  assert(!TerminationWatchdog::Evaluate(b, kT0 + 60'000).has_value());

  auto candidate = TerminationWatchdog::Evaluate(b, kT0 + 60'001);
  assert(candidate.has_value());
  assert(candidate->idle);
  assert(!candidate->expired);
  assert(candidate->idle_overage_seconds == 1);

  // part seconds round up
  assert(TerminationWatchdog::Evaluate(b, kT0 + 60'500)->idle_overage_seconds == 1);
  assert(TerminationWatchdog::Evaluate(b, kT0 + 61'000)->idle_overage_seconds == 1);
  assert(TerminationWatchdog::Evaluate(b, kT0 + 61'001)->idle_overage_seconds == 2);

  candidate = TerminationWatchdog::Evaluate(b, kT0 + 75'000);
  assert(candidate->idle_overage_seconds == 15);
}

void TestExpirationBoundaryIsStrict() {
  auto b          = Backend(BACKEND_STATUS_STARTING, kT0);
  b.expiration_ms = kT0 + 1'000;

  assert(!TerminationWatchdog::Evaluate(b, kT0 + 1'000).has_value());
  auto candidate = TerminationWatchdog::Evaluate(b, kT0 + 1'001);
  assert(candidate.has_value() && candidate->expired);
  assert(candidate->idle_overage_seconds == 0);
}

void TestNoBudgetsOrTerminatedIsNeverCandidate() {
  assert(!TerminationWatchdog::Evaluate(Backend(BACKEND_STATUS_READY, 0), kT0 * 2).has_value());

  auto terminated          = Backend(BACKEND_STATUS_TERMINATED, kT0);
  terminated.expiration_ms = kT0;
  assert(!TerminationWatchdog::Evaluate(terminated, kT0 + 10'000).has_value());
}

void TestSweepSoftTerminatesCandidatesOnce() {
  Fleet fleet;
  fleet.AddDrone("c1", "d1");
  const auto idle    = Spawn(fleet, MakeSpawnConfig("img", std::nullopt, 10));
  const auto expired = Spawn(fleet, MakeSpawnConfig("img", 5));
  const auto fine    = Spawn(fleet, MakeSpawnConfig("img", 3'600, 3'600));

  auto stats = fleet.watchdog->Sweep(kT0 + 11'000);
  assert(stats.soft_terminated == 2);
  assert(stats.hard_terminated == 0);
  assert(fleet.Backend(idle).status == BACKEND_STATUS_TERMINATING);
  assert(fleet.Backend(expired).status == BACKEND_STATUS_TERMINATING);
  assert(fleet.Backend(fine).status == BACKEND_STATUS_SCHEDULED);

  // Terminating backends are left alone when escalation is off.
  stats = fleet.watchdog->Sweep(kT0 + 500'000);
  assert(stats.soft_terminated == 0);
  assert(stats.hard_terminated == 0);
  assert(fleet.bus->Terminates().size() == 2);
}

void TestSweepEscalatesAfterGrace() {
  Fleet      fleet(std::make_shared<flotilla::db::memory::MemoryRepository>(), 30);
  fleet.AddDrone("c1", "d1");
  const auto id = Spawn(fleet, MakeSpawnConfig("img", 1));

  fleet.watchdog->Sweep(kT0 + 2'000);
  assert(fleet.Backend(id).status == BACKEND_STATUS_TERMINATING);

  // last_status is kT0 + 2s; grace runs out strictly after kT0 + 32s.
  auto stats = fleet.watchdog->Sweep(kT0 + 32'000);
  assert(stats.hard_terminated == 0);

  stats = fleet.watchdog->Sweep(kT0 + 32'001);
  assert(stats.hard_terminated == 1);
  assert(fleet.Backend(id).status == BACKEND_STATUS_HARD_TERMINATING);
  assert(fleet.bus->Terminates().back().command.terminate().kind() == TERMINATION_KIND_HARD);
}

void TestCandidatesFilterByDrone() {
  Fleet      fleet;
  const auto d1 = fleet.AddDrone("c1", "d1");
  fleet.AddDrone("c1", "d2");
  Spawn(fleet, MakeSpawnConfig("img", 1));
  Spawn(fleet, MakeSpawnConfig("img", 1));

  assert(fleet.watchdog->Candidates(kT0 + 5'000, "c1", "").size() == 2);

  auto on_d1 = fleet.watchdog->Candidates(kT0 + 5'000, "c1", "d1");
  assert(on_d1.size() == 1);
  assert(on_d1[0].backend.drone_id == d1);

  auto proto = TerminationWatchdog::ToProto(on_d1[0], kT0 + 5'000);
  assert(proto.expired());
  assert(proto.has_expiration_time());
  assert(!proto.has_allowed_idle_seconds());
}

} // namespace

int main() {
  TestIdleBoundaryIsStrict();
  TestExpirationBoundaryIsStrict();
  TestNoBudgetsOrTerminatedIsNeverCandidate();
  TestSweepSoftTerminatesCandidatesOnce();
  TestSweepEscalatesAfterGrace();
  TestCandidatesFilterByDrone();

  std::cout << "flotilla_unit_termination_watchdog: pass\n";
  return 0;
}
