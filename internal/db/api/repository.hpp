#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/backend_record.hpp"
#include "internal/db/model/drone_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/key_lock_record.hpp"

namespace flotilla::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Two transactions that read-then-write the same key lock row can not
    both commit; the loser fails in Commit() with TransactionConflict
  - Event ids are strictly increasing per store

  The DB is the source of truth for:
    drones
    backends and their status
    key locks
    events
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Drones
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertDrone(Transaction&, model::DroneRecord& record) = 0;

  virtual std::optional<model::DroneRecord> GetDrone(Transaction&, uint64_t id) = 0;

  // Newest non-terminated drone registered under (cluster, name).
  virtual std::optional<model::DroneRecord> GetLiveDroneByName(Transaction&, const std::string& cluster, const std::string& name) = 0;

  // Ordered by id.
  virtual std::vector<model::DroneRecord> ListDrones(Transaction&, const DroneFilter& filter) = 0;

  virtual Result UpdateDrone(Transaction&, const model::DroneRecord&) = 0;

  // ---------------------------------------------------------------------
  // Backends
  // ---------------------------------------------------------------------

  virtual Result InsertBackend(Transaction&, const model::BackendRecord&) = 0;

  virtual std::optional<model::BackendRecord> GetBackend(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::BackendRecord> ListBackends(Transaction&, const BackendFilter& filter) = 0;

  virtual Result UpdateBackend(Transaction&, const model::BackendRecord&) = 0;

  // ---------------------------------------------------------------------
  // Key locks
  // ---------------------------------------------------------------------

  virtual std::optional<model::KeyLockRecord> GetKeyLock(Transaction&, const std::string& cluster, const std::string& key) = 0;

  virtual Result UpsertKeyLock(Transaction&, const model::KeyLockRecord&) = 0;

  // Deleting a missing lock is not an error.
  virtual Result DeleteKeyLock(Transaction&, const std::string& cluster, const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  // Events with id > after_id, ascending, optionally only those for `key`.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t after_id, const std::optional<std::string>& key,
                                                     std::optional<uint64_t> max_entries) = 0;

  virtual std::optional<uint64_t> GetMaxEventId(Transaction&) = 0;

  virtual Result TrimEventsToMaxCount(Transaction&, uint64_t max_entries) = 0;
};

} // namespace flotilla::db
