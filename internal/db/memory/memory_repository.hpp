#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace flotilla::db::memory {

class MemoryTransaction;

// In-process repository for tests and single-controller deployments
// without a database. State is lost on restart.
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDrone(Transaction&, model::DroneRecord&) override;
  std::optional<model::DroneRecord> GetDrone(Transaction&, uint64_t) override;
  std::optional<model::DroneRecord> GetLiveDroneByName(Transaction&, const std::string& cluster, const std::string& name) override;
  std::vector<model::DroneRecord> ListDrones(Transaction&, const DroneFilter&) override;
  Result UpdateDrone(Transaction&, const model::DroneRecord&) override;

  Result InsertBackend(Transaction&, const model::BackendRecord&) override;
  std::optional<model::BackendRecord> GetBackend(Transaction&, const std::string&) override;
  std::vector<model::BackendRecord> ListBackends(Transaction&, const BackendFilter&) override;
  Result UpdateBackend(Transaction&, const model::BackendRecord&) override;

  std::optional<model::KeyLockRecord> GetKeyLock(Transaction&, const std::string& cluster, const std::string& key) override;
  Result UpsertKeyLock(Transaction&, const model::KeyLockRecord&) override;
  Result DeleteKeyLock(Transaction&, const std::string& cluster, const std::string& key) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t after_id, const std::optional<std::string>& key,
                                             std::optional<uint64_t> max_entries) override;
  std::optional<uint64_t> GetMaxEventId(Transaction&) override;
  Result TrimEventsToMaxCount(Transaction&, uint64_t max_entries) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::DroneRecord> drones;
    std::unordered_map<std::string, model::BackendRecord> backends;
    std::unordered_map<std::string, model::KeyLockRecord> key_locks;
    std::deque<model::EventRecord> events;

    uint64_t next_drone_id = 1;
    uint64_t next_event_id = 1;
  };

  // One transaction at a time; see MemoryTransaction.
  std::mutex tx_mutex_;
  State      state_;
};

} // namespace flotilla::db::memory
