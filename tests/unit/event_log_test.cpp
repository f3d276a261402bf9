#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include <google/protobuf/util/json_util.h>

#include "support/fleet_fixture.hpp"

namespace {

using namespace std::chrono_literals;
using namespace flotilla::v1;
using flotilla::events::SubscriptionOptions;
using flotilla::testing::Fleet;
using flotilla::testing::kT0;
using flotilla::testing::MakeConnect;

void TestAppendStoresCanonicalJson() {
  Fleet fleet;

  BackendStatusUpdate update;
  update.set_backend_id("b1");
  update.set_status(BACKEND_STATUS_READY);

  auto tx = fleet.repository->Begin();
  auto id = fleet.events->Append(*tx, flotilla::events::kind::kBackendStatus, std::string("b1"), update);
  tx->Commit();
  assert(id == 1);
  assert(fleet.events->LatestId() == 1);

  auto events = fleet.events->Read(0, std::nullopt, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].kind() == "backend_status");
  assert(events[0].key() == "b1");

  BackendStatusUpdate parsed;
  assert(google::protobuf::util::JsonStringToMessage(events[0].payload_json(), &parsed).ok());
  assert(parsed.status() == BACKEND_STATUS_READY);
  assert(events[0].payload_json().find("\"backend_id\"") != std::string::npos);
}

void TestRolledBackAppendLeavesNoEvent() {
  Fleet fleet;
  {
    auto tx = fleet.repository->Begin();
    fleet.events->Append(*tx, flotilla::events::kind::kDroneDrain, std::nullopt, DroneInfo{});
  }
  assert(fleet.events->LatestId() == 0);
  assert(fleet.events->Read(0, std::nullopt, std::nullopt).empty());
}

void TestEntitySubscriptionSeesOnlyItsKey() {
  Fleet fleet;
  fleet.AddDrone("c1", "d1");
  const auto a = fleet.connect->Connect(MakeConnect("c1", "", ""), kT0).backend_id();
  const auto b = fleet.connect->Connect(MakeConnect("c1", "", ""), kT0).backend_id();

  SubscriptionOptions options;
  options.key = a;
  auto sub    = fleet.events->Subscribe(options);

  auto batch = sub->Next(100ms);
  assert(batch.has_value());
  assert(batch->size() == 1);
  assert((*batch)[0].key() == a);

  fleet.lifecycle->ApplyStatus(b, BACKEND_STATUS_READY, kT0 + 1);
  batch = sub->Next(50ms);
  assert(batch.has_value() && batch->empty());

  fleet.lifecycle->ApplyStatus(a, BACKEND_STATUS_READY, kT0 + 1);
  batch = sub->Next(50ms);
  assert(batch->size() == 1);
}

void TestCommitWakesWaitingSubscriber() {
  Fleet fleet;
  fleet.AddDrone("c1", "d1");

  SubscriptionOptions options;
  options.after_id = fleet.events->LatestId();
  auto sub         = fleet.events->Subscribe(options);

  std::thread writer([&] {
    std::this_thread::sleep_for(20ms);
    fleet.connect->Connect(MakeConnect("c1", "k", "t1"), kT0);
  });

  const auto started = std::chrono::steady_clock::now();
  auto       batch   = sub->Next(5s);
  writer.join();

  assert(batch.has_value());
  assert(!batch->empty());
  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(sub->Cursor() >= (*batch).back().id());
}

void TestCancelAndShutdownEndSubscriptions() {
  Fleet fleet;
  auto  sub = fleet.events->Subscribe({});
  sub->Cancel();
  assert(!sub->Next(10ms).has_value());

  auto other = fleet.events->Subscribe({});
  fleet.events->Shutdown();
  assert(!other->Next(1s).has_value());
}

void TestRetentionTrimsOldestEvents() {
  auto                      repository = std::make_shared<flotilla::db::memory::MemoryRepository>();
  flotilla::events::EventLog log(repository, 3);

  for (int i = 0; i < 5; ++i) {
    auto tx = repository->Begin();
    log.Append(*tx, flotilla::events::kind::kDroneStatus, std::nullopt, DroneInfo{});
    tx->Commit();
  }

  auto events = log.Read(0, std::nullopt, std::nullopt);
  assert(events.size() == 3);
  assert(events.front().id() == 3);
  assert(log.LatestId() == 5);
}

} // namespace

int main() {
  TestAppendStoresCanonicalJson();
  TestRolledBackAppendLeavesNoEvent();
  TestEntitySubscriptionSeesOnlyItsKey();
  TestCommitWakesWaitingSubscriber();
  TestCancelAndShutdownEndSubscriptions();
  TestRetentionTrimsOldestEvents();

  std::cout << "flotilla_unit_event_log: pass\n";
  return 0;
}
