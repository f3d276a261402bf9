#include "memory_tx.hpp"

namespace flotilla::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), guard_(repo_.tx_mutex_) {
  next_drone_id_before_ = repo_.state_.next_drone_id;
  next_event_id_before_ = repo_.state_.next_event_id;
}

MemoryTransaction::~MemoryTransaction() {
  if (IsOpen()) Rollback();
}

template <typename Map, typename Key>
void MemoryTransaction::SaveRow(const Map& rows, std::unordered_map<Key, std::optional<typename Map::mapped_type>>& journal, const Key& key) {
  if (journal.contains(key)) return;

  const auto it = rows.find(key);
  if (it == rows.end()) {
    journal.emplace(key, std::nullopt);
  } else {
    journal.emplace(key, it->second);
  }
}

template <typename Map, typename Journal>
void MemoryTransaction::RestoreRows(Map& rows, Journal& journal) {
  for (auto& [key, before] : journal) {
    if (before) {
      rows[key] = std::move(*before);
    } else {
      rows.erase(key);
    }
  }
  journal.clear();
}

void MemoryTransaction::SaveDrone(uint64_t id) {
  SaveRow(repo_.state_.drones, drones_before_, id);
}

void MemoryTransaction::SaveBackend(const std::string& id) {
  SaveRow(repo_.state_.backends, backends_before_, id);
}

void MemoryTransaction::SaveKeyLock(const std::string& lock_key) {
  SaveRow(repo_.state_.key_locks, key_locks_before_, lock_key);
}

void MemoryTransaction::SaveTrimmed(model::EventRecord event) {
  trimmed_.push_back(std::move(event));
}

void MemoryTransaction::DoCommit() {
  drones_before_.clear();
  backends_before_.clear();
  key_locks_before_.clear();
  trimmed_.clear();
  guard_.unlock();
}

void MemoryTransaction::DoRollback() {
  auto& s = repo_.state_;

  RestoreRows(s.drones, drones_before_);
  RestoreRows(s.backends, backends_before_);
  RestoreRows(s.key_locks, key_locks_before_);

  // drop events appended here, then put trimmed ones back in order
  while (!s.events.empty() && s.events.back().id >= next_event_id_before_) {
    s.events.pop_back();
  }
  for (auto it = trimmed_.rbegin(); it != trimmed_.rend(); ++it) {
    if (it->id < next_event_id_before_) s.events.push_front(std::move(*it));
  }
  trimmed_.clear();

  s.next_drone_id = next_drone_id_before_;
  s.next_event_id = next_event_id_before_;
  guard_.unlock();
}

} // namespace flotilla::db::memory
