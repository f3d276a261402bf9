#include <cassert>
#include <iostream>

#include "internal/model/backend_state_machine.hpp"

namespace {

using namespace flotilla::v1;
using flotilla::model::CanTransition;
using flotilla::model::IsHealthy;
using flotilla::model::IsLive;
using flotilla::model::IsTerminal;
using flotilla::model::ShouldApply;

void TestOnlyStrictlyGreaterStatusApplies() {
  assert(ShouldApply(BACKEND_STATUS_SCHEDULED, BACKEND_STATUS_STARTING));
  assert(ShouldApply(BACKEND_STATUS_SCHEDULED, BACKEND_STATUS_READY));
  assert(ShouldApply(BACKEND_STATUS_READY, BACKEND_STATUS_TERMINATED));
  assert(ShouldApply(BACKEND_STATUS_TERMINATING, BACKEND_STATUS_HARD_TERMINATING));

  assert(!ShouldApply(BACKEND_STATUS_READY, BACKEND_STATUS_READY));
  assert(!ShouldApply(BACKEND_STATUS_READY, BACKEND_STATUS_STARTING));
  assert(!ShouldApply(BACKEND_STATUS_HARD_TERMINATING, BACKEND_STATUS_TERMINATING));
  assert(!ShouldApply(BACKEND_STATUS_SCHEDULED, BACKEND_STATUS_UNSPECIFIED));
}

void TestTerminatedIsAbsorbing() {
  for (auto incoming : {BACKEND_STATUS_SCHEDULED, BACKEND_STATUS_STARTING, BACKEND_STATUS_READY, BACKEND_STATUS_TERMINATING,
                        BACKEND_STATUS_HARD_TERMINATING, BACKEND_STATUS_TERMINATED}) {
    assert(!ShouldApply(BACKEND_STATUS_TERMINATED, incoming));
  }
  assert(IsTerminal(BACKEND_STATUS_TERMINATED));
  assert(!IsLive(BACKEND_STATUS_TERMINATED));
}

void TestOutOfOrderReportsConvergeOnMaximum() {
  const BackendStatus reports[] = {BACKEND_STATUS_READY, BACKEND_STATUS_SCHEDULED, BACKEND_STATUS_STARTING, BACKEND_STATUS_READY};

  BackendStatus stored = BACKEND_STATUS_SCHEDULED;
  for (auto report : reports) {
    if (ShouldApply(stored, report)) stored = report;
  }
  assert(stored == BACKEND_STATUS_READY);
}

void TestHealthyStatuses() {
  assert(IsHealthy(BACKEND_STATUS_SCHEDULED));
  assert(IsHealthy(BACKEND_STATUS_STARTING));
  assert(IsHealthy(BACKEND_STATUS_READY));
  assert(!IsHealthy(BACKEND_STATUS_TERMINATING));
  assert(!IsHealthy(BACKEND_STATUS_HARD_TERMINATING));
  assert(!IsHealthy(BACKEND_STATUS_TERMINATED));
}

void TestDroneTransitions() {
  assert(CanTransition(DRONE_STATUS_STARTING, DRONE_STATUS_AVAILABLE));
  assert(CanTransition(DRONE_STATUS_AVAILABLE, DRONE_STATUS_TERMINATED));
  assert(CanTransition(DRONE_STATUS_STARTING, DRONE_STATUS_TERMINATED));
  assert(!CanTransition(DRONE_STATUS_AVAILABLE, DRONE_STATUS_STARTING));
  assert(!CanTransition(DRONE_STATUS_TERMINATED, DRONE_STATUS_AVAILABLE));
}

} // namespace

int main() {
  TestOnlyStrictlyGreaterStatusApplies();
  TestTerminatedIsAbsorbing();
  TestOutOfOrderReportsConvergeOnMaximum();
  TestHealthyStatuses();
  TestDroneTransitions();

  std::cout << "flotilla_unit_backend_state_machine: pass\n";
  return 0;
}
