#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/fleet_fixture.hpp"

namespace {

namespace db = flotilla::db;
using namespace flotilla::v1;
using flotilla::lock::KeyLockState;
using flotilla::testing::Fleet;
using flotilla::testing::kT0;
using flotilla::testing::MakeConnect;

void TestMissingLockIsUnheld() {
  Fleet fleet;
  auto  tx   = fleet.repository->Begin();
  auto  view = fleet.locks->Inspect(*tx, "c1", "k");
  assert(view.state == KeyLockState::kUnheld);
  assert(!view.lock.has_value());
}

void TestHolderStatusDecidesHealth() {
  Fleet fleet;
  fleet.AddDrone("c1", "d1");
  auto resp = fleet.connect->Connect(MakeConnect("c1", "k", "t1"), kT0);

  {
    auto tx   = fleet.repository->Begin();
    auto view = fleet.locks->Inspect(*tx, "c1", "k");
    assert(view.state == KeyLockState::kHeldHealthy);
    assert(view.lock->tag == "t1");
    assert(view.holder->id == resp.backend_id());
  }

  fleet.lifecycle->ApplyStatus(resp.backend_id(), BACKEND_STATUS_TERMINATING, kT0 + 1);
  {
    auto tx = fleet.repository->Begin();
    assert(fleet.locks->Inspect(*tx, "c1", "k").state == KeyLockState::kHeldUnhealthy);
  }

  fleet.lifecycle->ApplyStatus(resp.backend_id(), BACKEND_STATUS_TERMINATED, kT0 + 2);
  {
    auto tx = fleet.repository->Begin();
    assert(fleet.locks->Inspect(*tx, "c1", "k").state == KeyLockState::kUnheld);
  }
  assert(!fleet.Lock("c1", "k").has_value());
}

void TestHolderOnTerminatedDroneIsUnhealthy() {
  Fleet      fleet;
  const auto drone = fleet.AddDrone("c1", "d1");
  fleet.connect->Connect(MakeConnect("c1", "k", ""), kT0);

  fleet.nodes->Shutdown(drone);

  auto tx = fleet.repository->Begin();
  assert(fleet.locks->Inspect(*tx, "c1", "k").state == KeyLockState::kHeldUnhealthy);
}

void TestReleaseIfHeldByIgnoresOtherHolders() {
  Fleet fleet;
  fleet.AddDrone("c1", "d1");
  auto resp = fleet.connect->Connect(MakeConnect("c1", "k", "t1"), kT0);

  auto tx = fleet.repository->Begin();
  assert(!fleet.locks->ReleaseIfHeldBy(*tx, "c1", "k", "some-other-backend"));
  assert(fleet.locks->ReleaseIfHeldBy(*tx, "c1", "k", resp.backend_id()));
  tx->Commit();
  assert(!fleet.Lock("c1", "k").has_value());
}

void TestExplicitReleaseRemovesLockAndIsIdempotent() {
  Fleet fleet;
  fleet.AddDrone("c1", "d1");
  fleet.connect->Connect(MakeConnect("c1", "k", "t1"), kT0);

  fleet.locks->Release("c1", "k");
  assert(!fleet.Lock("c1", "k").has_value());
  fleet.locks->Release("c1", "k");

  auto released = fleet.events->Read(0, std::nullopt, std::nullopt);
  int  count    = 0;
  for (const auto& e : released)
    if (e.kind() == "key_released") ++count;
  assert(count == 1);
}

void TestGeneratedTagsDiffer() {
  const auto a = flotilla::lock::KeyLockTable::GenerateTag();
  const auto b = flotilla::lock::KeyLockTable::GenerateTag();
  assert(a.size() == 16);
  assert(a != b);
}

// Memory repository whose lock deletes fail once armed.
class FailingDeletes final : public db::Repository {
 public:
  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result InsertDrone(db::Transaction& tx, db::model::DroneRecord& r) override {
    return inner_.InsertDrone(tx, r);
  }
  std::optional<db::model::DroneRecord> GetDrone(db::Transaction& tx, uint64_t id) override {
    return inner_.GetDrone(tx, id);
  }
  std::optional<db::model::DroneRecord> GetLiveDroneByName(db::Transaction& tx, const std::string& cluster, const std::string& name) override {
    return inner_.GetLiveDroneByName(tx, cluster, name);
  }
  std::vector<db::model::DroneRecord> ListDrones(db::Transaction& tx, const db::DroneFilter& filter) override {
    return inner_.ListDrones(tx, filter);
  }
  db::Result UpdateDrone(db::Transaction& tx, const db::model::DroneRecord& r) override {
    return inner_.UpdateDrone(tx, r);
  }

  db::Result InsertBackend(db::Transaction& tx, const db::model::BackendRecord& r) override {
    return inner_.InsertBackend(tx, r);
  }
  std::optional<db::model::BackendRecord> GetBackend(db::Transaction& tx, const std::string& id) override {
    return inner_.GetBackend(tx, id);
  }
  std::vector<db::model::BackendRecord> ListBackends(db::Transaction& tx, const db::BackendFilter& filter) override {
    return inner_.ListBackends(tx, filter);
  }
  db::Result UpdateBackend(db::Transaction& tx, const db::model::BackendRecord& r) override {
    return inner_.UpdateBackend(tx, r);
  }

  std::optional<db::model::KeyLockRecord> GetKeyLock(db::Transaction& tx, const std::string& cluster, const std::string& key) override {
    return inner_.GetKeyLock(tx, cluster, key);
  }
  db::Result UpsertKeyLock(db::Transaction& tx, const db::model::KeyLockRecord& r) override {
    return inner_.UpsertKeyLock(tx, r);
  }
  db::Result DeleteKeyLock(db::Transaction& tx, const std::string& cluster, const std::string& key) override {
    if (fail_deletes) return db::Result::Err(db::ErrorCode::IOError, "disk unavailable");
    return inner_.DeleteKeyLock(tx, cluster, key);
  }

  db::Result AppendEvent(db::Transaction& tx, db::model::EventRecord& r) override {
    return inner_.AppendEvent(tx, r);
  }
  std::vector<db::model::EventRecord> ReadEvents(db::Transaction& tx, uint64_t after_id, const std::optional<std::string>& key,
                                                 std::optional<uint64_t> max_entries) override {
    return inner_.ReadEvents(tx, after_id, key, max_entries);
  }
  std::optional<uint64_t> GetMaxEventId(db::Transaction& tx) override {
    return inner_.GetMaxEventId(tx);
  }
  db::Result TrimEventsToMaxCount(db::Transaction& tx, uint64_t max_entries) override {
    return inner_.TrimEventsToMaxCount(tx, max_entries);
  }

  bool fail_deletes = false;

 private:
  db::memory::MemoryRepository inner_;
};

void TestReleaseStoreFailureIsFailedToRemoveKey() {
  auto  repo = std::make_shared<FailingDeletes>();
  Fleet fleet(repo);
  fleet.AddDrone("c1", "d1");
  const auto resp = fleet.connect->Connect(MakeConnect("c1", "k", "t1"), kT0);

  repo->fail_deletes = true;
  bool threw         = false;
  try {
    fleet.locks->Release("c1", "k");
  } catch (const flotilla::util::FailedToRemoveKey& e) {
    threw = true;
    assert(std::string(e.what()).find("disk") == std::string::npos);
  }
  assert(threw);

  // nothing was released
  auto lock = fleet.Lock("c1", "k");
  assert(lock.has_value());
  assert(lock->backend_id == resp.backend_id());

  repo->fail_deletes = false;
  fleet.locks->Release("c1", "k");
  assert(!fleet.Lock("c1", "k").has_value());
}

} // namespace

int main() {
  TestMissingLockIsUnheld();
  TestHolderStatusDecidesHealth();
  TestHolderOnTerminatedDroneIsUnhealthy();
  TestReleaseIfHeldByIgnoresOtherHolders();
  TestExplicitReleaseRemovesLockAndIsIdempotent();
  TestGeneratedTagsDiffer();
  TestReleaseStoreFailureIsFailedToRemoveKey();

  std::cout << "flotilla_unit_key_lock_table: pass\n";
  return 0;
}
