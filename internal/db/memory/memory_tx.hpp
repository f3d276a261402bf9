#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace flotilla::db::memory {

/*
  Transaction over a MemoryRepository.

  Holds the repository's transaction mutex from Begin() to Commit() or
  Rollback(), the way SqliteTransaction holds BEGIN IMMEDIATE, so
  transactions never conflict. Writes go straight to the shared state;
  the first write to a row saves its prior value in an undo journal that
  Rollback() replays.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryRepository::State& Mutable() {
    return repo_.state_;
  }

  const MemoryRepository::State& View() const {
    return repo_.state_;
  }

  // Journal the current value of a row before it is overwritten or erased.
  void SaveDrone(uint64_t id);
  void SaveBackend(const std::string& id);
  void SaveKeyLock(const std::string& lock_key);

  void SaveTrimmed(model::EventRecord event);

 private:
  void DoCommit() override;
  void DoRollback() override;

  template <typename Map, typename Key>
  static void SaveRow(const Map& rows, std::unordered_map<Key, std::optional<typename Map::mapped_type>>& journal, const Key& key);

  template <typename Map, typename Journal>
  static void RestoreRows(Map& rows, Journal& journal);

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> guard_;

  std::unordered_map<uint64_t, std::optional<model::DroneRecord>>      drones_before_;
  std::unordered_map<std::string, std::optional<model::BackendRecord>> backends_before_;
  std::unordered_map<std::string, std::optional<model::KeyLockRecord>> key_locks_before_;
  std::deque<model::EventRecord>                                       trimmed_;

  uint64_t next_drone_id_before_ = 0;
  uint64_t next_event_id_before_ = 0;
};

} // namespace flotilla::db::memory
