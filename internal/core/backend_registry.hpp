#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flotilla/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace flotilla::events {
class EventLog;
}

namespace flotilla::core {

/*
  Backend rows: identity, owning drone, status and idle/expiration budget.

  Status changes go through BackendLifecycle; this class only creates rows
  and records keepalives.
*/
class BackendRegistry {
 public:
  BackendRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events);

  // New Scheduled backend on `drone_id`; appends its first backend_status event.
  db::model::BackendRecord Create(db::Transaction& tx, const std::string& cluster, uint64_t drone_id, const flotilla::v1::SpawnConfig& spawn_config,
                                  const std::string& key, uint64_t now_ms);

  std::optional<db::model::BackendRecord> Get(db::Transaction& tx, const std::string& backend_id);

  // Throws util::NotFound.
  db::model::BackendRecord Require(db::Transaction& tx, const std::string& backend_id);

  std::vector<db::model::BackendRecord> List(db::Transaction& tx, const db::BackendFilter& filter);

  /*
    Moves last_keepalive forward to `time_ms`. Keepalives for Terminated
    backends and stale keepalives are ignored; neither writes an event.
    Throws util::NotFound for an unknown backend.
  */
  void Keepalive(const std::string& backend_id, uint64_t time_ms);

  static flotilla::v1::SpawnConfig SpawnConfigOf(const db::model::BackendRecord& record);

  static flotilla::v1::BackendInfo ToProto(const db::model::BackendRecord& record, bool orphaned);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventLog> events_;
};

} // namespace flotilla::core
