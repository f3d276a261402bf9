#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace flotilla::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Applies the schema with IF NOT EXISTS; safe on every start.
  void BootstrapSchema();

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
