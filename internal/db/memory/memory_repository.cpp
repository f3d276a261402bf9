#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>

#include "memory_tx.hpp"

namespace flotilla::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string LockKey(const std::string& cluster, const std::string& key) {
  return cluster + "#" + key;
}

bool IsTerminated(const model::DroneRecord& r) {
  return r.status == flotilla::v1::DRONE_STATUS_TERMINATED;
}

bool IsTerminated(const model::BackendRecord& r) {
  return r.status == flotilla::v1::BACKEND_STATUS_TERMINATED;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Drones
// ------------------------------------------------------------------

Result MemoryRepository::InsertDrone(Transaction& t, model::DroneRecord& r) {
  auto& s = TX(t).Mutable();
  if (!IsTerminated(r)) {
    for (const auto& [_, existing] : s.drones) {
      if (existing.cluster == r.cluster && existing.name == r.name && !IsTerminated(existing)) {
        return Result::Err(ErrorCode::ConstraintViolation, "live drone already registered under this name");
      }
    }
  }

  r.id = s.next_drone_id++;
  TX(t).SaveDrone(r.id);
  s.drones[r.id] = r;
  return Result::Ok();
}

std::optional<model::DroneRecord> MemoryRepository::GetDrone(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.drones.find(id);
  if (it == s.drones.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DroneRecord> MemoryRepository::GetLiveDroneByName(Transaction& t, const std::string& cluster, const std::string& name) {
  const auto& s = TX(t).View();
  for (auto it = s.drones.rbegin(); it != s.drones.rend(); ++it) {
    const auto& r = it->second;
    if (r.cluster == cluster && r.name == name && !IsTerminated(r)) return r;
  }
  return std::nullopt;
}

std::vector<model::DroneRecord> MemoryRepository::ListDrones(Transaction& t, const DroneFilter& filter) {
  std::vector<model::DroneRecord> out;
  for (const auto& [_, r] : TX(t).View().drones) {
    if (filter.cluster && r.cluster != *filter.cluster) continue;
    if (!filter.include_terminated && IsTerminated(r)) continue;
    out.push_back(r);
  }
  return out;
}

Result MemoryRepository::UpdateDrone(Transaction& t, const model::DroneRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.drones.find(r.id);
  if (it == s.drones.end()) return Result::Err(ErrorCode::NotFound);
  TX(t).SaveDrone(r.id);
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

Result MemoryRepository::InsertBackend(Transaction& t, const model::BackendRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.backends.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (!s.drones.contains(r.drone_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown drone");
  TX(t).SaveBackend(r.id);
  s.backends[r.id] = r;
  return Result::Ok();
}

std::optional<model::BackendRecord> MemoryRepository::GetBackend(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.backends.find(id);
  if (it == s.backends.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BackendRecord> MemoryRepository::ListBackends(Transaction& t, const BackendFilter& filter) {
  std::vector<model::BackendRecord> out;
  for (const auto& [_, r] : TX(t).View().backends) {
    if (filter.cluster && r.cluster != *filter.cluster) continue;
    if (filter.drone_id && r.drone_id != *filter.drone_id) continue;
    if (!filter.include_terminated && IsTerminated(r)) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const model::BackendRecord& a, const model::BackendRecord& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::UpdateBackend(Transaction& t, const model::BackendRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.backends.find(r.id);
  if (it == s.backends.end()) return Result::Err(ErrorCode::NotFound);
  TX(t).SaveBackend(r.id);
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Key locks
// ------------------------------------------------------------------

std::optional<model::KeyLockRecord> MemoryRepository::GetKeyLock(Transaction& t, const std::string& cluster, const std::string& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.key_locks.find(LockKey(cluster, key));
  if (it == s.key_locks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertKeyLock(Transaction& t, const model::KeyLockRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.backends.contains(r.backend_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown backend");
  const auto lock_key = LockKey(r.cluster, r.key);
  TX(t).SaveKeyLock(lock_key);
  s.key_locks[lock_key] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteKeyLock(Transaction& t, const std::string& cluster, const std::string& key) {
  const auto lock_key = LockKey(cluster, key);
  TX(t).SaveKeyLock(lock_key);
  TX(t).Mutable().key_locks.erase(lock_key);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_event_id++;
  if (r.timestamp_ms == 0) {
    r.timestamp_ms = NowMs();
  }
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, uint64_t after_id, const std::optional<std::string>& key,
                                                             std::optional<uint64_t> max_entries) {
  std::vector<model::EventRecord> out;
  for (const auto& e : TX(t).View().events) {
    if (e.id <= after_id) continue;
    if (key && e.key != key) continue;
    out.push_back(e);
    if (max_entries.has_value() && out.size() >= *max_entries) break;
  }
  return out;
}

std::optional<uint64_t> MemoryRepository::GetMaxEventId(Transaction& t) {
  const auto& s = TX(t).View();
  if (s.next_event_id == 1) return std::nullopt;
  return s.next_event_id - 1;
}

Result MemoryRepository::TrimEventsToMaxCount(Transaction& t, uint64_t max_entries) {
  if (max_entries == 0 || TX(t).View().events.size() <= max_entries) {
    return Result::Ok();
  }

  auto& events = TX(t).Mutable().events;
  while (events.size() > max_entries) {
    TX(t).SaveTrimmed(std::move(events.front()));
    events.pop_front();
  }
  return Result::Ok();
}

} // namespace flotilla::db::memory
