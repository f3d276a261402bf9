#include "pg_repository.hpp"

#include <chrono>

#include "internal/db/sql/schema.hpp"

namespace flotilla::db::postgres {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

model::DroneRecord ReadDrone(const pqxx::row& row) {
  model::DroneRecord r;
  r.id                = row[0].as<uint64_t>();
  r.cluster           = row[1].c_str();
  r.name              = row[2].c_str();
  r.controller        = row[3].c_str();
  r.version           = row[4].c_str();
  r.build_hash        = row[5].c_str();
  r.status            = static_cast<flotilla::v1::DroneStatus>(row[6].as<int>());
  r.last_heartbeat_ms = row[7].as<uint64_t>();
  r.draining          = row[8].as<bool>();
  return r;
}

model::BackendRecord ReadBackend(const pqxx::row& row) {
  model::BackendRecord r;
  r.id                   = row[0].c_str();
  r.cluster              = row[1].c_str();
  r.drone_id             = row[2].as<uint64_t>();
  r.status               = static_cast<flotilla::v1::BackendStatus>(row[3].as<int>());
  r.last_status_ms       = row[4].as<uint64_t>();
  r.last_keepalive_ms    = row[5].as<uint64_t>();
  r.expiration_ms        = OptU64(row[6]);
  r.allowed_idle_seconds = OptU64(row[7]);
  r.spawn_config_json    = row[8].c_str();
  r.key                  = row[9].c_str();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.id           = row[0].as<uint64_t>();
  r.timestamp_ms = row[1].as<uint64_t>();
  if (!row[2].is_null()) r.key = row[2].c_str();
  r.kind         = row[3].c_str();
  r.payload_json = row[4].c_str();
  return r;
}

// Reads run inside a serializable transaction too; a concurrent writer can
// abort them.
template <typename Fn>
auto GuardRead(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::serialization_failure& e) {
    throw TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw TransactionConflict(e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema() {
  auto       conn = pool_->Acquire();
  pqxx::work work(*conn);
  for (const auto& sql : sql::PostgresSchema()) {
    work.exec(sql);
  }
  work.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(*pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Drones
// ------------------------------------------------------------------

Result PgRepository::InsertDrone(Transaction& t, model::DroneRecord& r) {
  try {
    auto res = TX(t).Tx().exec_prepared1("insert_drone", r.cluster, r.name, r.controller, r.version, r.build_hash, static_cast<int>(r.status),
                                         r.last_heartbeat_ms, r.draining);
    r.id     = res[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DroneRecord> PgRepository::GetDrone(Transaction& t, uint64_t id) {
  return GuardRead([&]() -> std::optional<model::DroneRecord> {
    auto res = TX(t).Tx().exec_prepared("get_drone", id);
    if (res.empty()) return std::nullopt;
    return ReadDrone(res[0]);
  });
}

std::optional<model::DroneRecord> PgRepository::GetLiveDroneByName(Transaction& t, const std::string& cluster, const std::string& name) {
  return GuardRead([&]() -> std::optional<model::DroneRecord> {
    auto res = TX(t).Tx().exec_prepared("get_live_drone_by_name", cluster, name);
    if (res.empty()) return std::nullopt;
    return ReadDrone(res[0]);
  });
}

std::vector<model::DroneRecord> PgRepository::ListDrones(Transaction& t, const DroneFilter& filter) {
  return GuardRead([&] {
    auto res = TX(t).Tx().exec_params(
        "SELECT id,cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining FROM drone "
        "WHERE ($1::text IS NULL OR cluster=$1) AND ($2 OR status<>3) ORDER BY id ASC;",
        filter.cluster, filter.include_terminated);

    std::vector<model::DroneRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadDrone(row));
    }
    return out;
  });
}

Result PgRepository::UpdateDrone(Transaction& t, const model::DroneRecord& r) {
  try {
    auto res = TX(t).Tx().exec_prepared("update_drone", r.id, r.cluster, r.name, r.controller, r.version, r.build_hash,
                                        static_cast<int>(r.status), r.last_heartbeat_ms, r.draining);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

Result PgRepository::InsertBackend(Transaction& t, const model::BackendRecord& r) {
  try {
    TX(t).Tx().exec_prepared("insert_backend", r.id, r.cluster, r.drone_id, static_cast<int>(r.status), r.last_status_ms,
                             r.last_keepalive_ms, r.expiration_ms, r.allowed_idle_seconds, r.spawn_config_json, r.key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BackendRecord> PgRepository::GetBackend(Transaction& t, const std::string& id) {
  return GuardRead([&]() -> std::optional<model::BackendRecord> {
    auto res = TX(t).Tx().exec_prepared("get_backend", id);
    if (res.empty()) return std::nullopt;
    return ReadBackend(res[0]);
  });
}

std::vector<model::BackendRecord> PgRepository::ListBackends(Transaction& t, const BackendFilter& filter) {
  return GuardRead([&] {
    auto res = TX(t).Tx().exec_params(
        "SELECT id,cluster,drone_id,status,last_status_ms,last_keepalive_ms,expiration_ms,allowed_idle_seconds,spawn_config::text,key "
        "FROM backend WHERE ($1::text IS NULL OR cluster=$1) AND ($2::bigint IS NULL OR drone_id=$2) AND ($3 OR status<>6) "
        "ORDER BY id ASC;",
        filter.cluster, filter.drone_id, filter.include_terminated);

    std::vector<model::BackendRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadBackend(row));
    }
    return out;
  });
}

Result PgRepository::UpdateBackend(Transaction& t, const model::BackendRecord& r) {
  try {
    auto res = TX(t).Tx().exec_prepared("update_backend", r.id, r.cluster, r.drone_id, static_cast<int>(r.status), r.last_status_ms,
                                        r.last_keepalive_ms, r.expiration_ms, r.allowed_idle_seconds, r.spawn_config_json, r.key);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Key locks
// ------------------------------------------------------------------

std::optional<model::KeyLockRecord> PgRepository::GetKeyLock(Transaction& t, const std::string& cluster, const std::string& key) {
  return GuardRead([&]() -> std::optional<model::KeyLockRecord> {
    auto res = TX(t).Tx().exec_prepared("get_key_lock", cluster, key);
    if (res.empty()) return std::nullopt;

    model::KeyLockRecord r;
    r.cluster        = res[0][0].c_str();
    r.key            = res[0][1].c_str();
    r.backend_id     = res[0][2].c_str();
    r.tag            = res[0][3].c_str();
    r.acquired_at_ms = res[0][4].as<uint64_t>();
    return r;
  });
}

Result PgRepository::UpsertKeyLock(Transaction& t, const model::KeyLockRecord& r) {
  try {
    TX(t).Tx().exec_prepared("upsert_key_lock", r.cluster, r.key, r.backend_id, r.tag, r.acquired_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteKeyLock(Transaction& t, const std::string& cluster, const std::string& key) {
  try {
    TX(t).Tx().exec_prepared("delete_key_lock", cluster, key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  try {
    if (r.timestamp_ms == 0) {
      r.timestamp_ms = NowMs();
    }
    auto res = TX(t).Tx().exec_prepared1("insert_event", r.timestamp_ms, r.key, r.kind, r.payload_json);
    r.id     = res[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, uint64_t after_id, const std::optional<std::string>& key,
                                                         std::optional<uint64_t> max_entries) {
  return GuardRead([&] {
    // LIMIT NULL means no limit
    auto res = key ? TX(t).Tx().exec_prepared("read_key_events", after_id, *key, max_entries)
                   : TX(t).Tx().exec_prepared("read_events", after_id, max_entries);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadEvent(row));
    }
    return out;
  });
}

std::optional<uint64_t> PgRepository::GetMaxEventId(Transaction& t) {
  return GuardRead([&] {
    auto res = TX(t).Tx().exec_prepared1("max_event_id");
    return OptU64(res[0]);
  });
}

Result PgRepository::TrimEventsToMaxCount(Transaction& t, uint64_t max_entries) {
  if (max_entries == 0) return Result::Ok();

  try {
    TX(t).Tx().exec_prepared("trim_events", max_entries - 1);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace flotilla::db::postgres
