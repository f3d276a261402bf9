#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <chrono>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace flotilla::db::sqlite {

using flotilla::db::ErrorCode;
using flotilla::db::Result;

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

/*
  Owns one prepared statement. Reads throw SqliteError when the statement
  can not be prepared; writes report the failure through Result.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK;
  }

  int PrepareCode() const {
    return rc_;
  }

  Statement& RequireOk() {
    if (!Ok()) throw SqliteError(rc_, std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return *this;
  }

  void Text(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
  }

  void U64(int idx, uint64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
  }

  void I64(int idx, sqlite3_int64 v) {
    sqlite3_bind_int64(st_, idx, v);
  }

  void I32(int idx, int v) {
    sqlite3_bind_int(st_, idx, v);
  }

  void Null(int idx) {
    sqlite3_bind_null(st_, idx);
  }

  void OptU64(int idx, const std::optional<uint64_t>& v) {
    if (v) {
      U64(idx, *v);
    } else {
      Null(idx);
    }
  }

  void OptText(int idx, const std::optional<std::string>& v) {
    if (v) {
      Text(idx, *v);
    } else {
      Null(idx);
    }
  }

  // SQLITE_ROW, SQLITE_DONE or an error; reads throw on error.
  int Step() {
    return sqlite3_step(st_);
  }

  bool NextRow() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SqliteError(rc, std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  std::string ColText(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  uint64_t ColU64(int col) const {
    return static_cast<uint64_t>(sqlite3_column_int64(st_, col));
  }

  int ColI32(int col) const {
    return sqlite3_column_int(st_, col);
  }

  bool ColNull(int col) const {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

  std::optional<uint64_t> ColOptU64(int col) const {
    if (ColNull(col)) return std::nullopt;
    return ColU64(col);
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

model::DroneRecord ReadDrone(const Statement& st) {
  model::DroneRecord r;
  r.id                = st.ColU64(0);
  r.cluster           = st.ColText(1);
  r.name              = st.ColText(2);
  r.controller        = st.ColText(3);
  r.version           = st.ColText(4);
  r.build_hash        = st.ColText(5);
  r.status            = static_cast<flotilla::v1::DroneStatus>(st.ColI32(6));
  r.last_heartbeat_ms = st.ColU64(7);
  r.draining          = st.ColI32(8) != 0;
  return r;
}

model::BackendRecord ReadBackend(const Statement& st) {
  model::BackendRecord r;
  r.id                   = st.ColText(0);
  r.cluster              = st.ColText(1);
  r.drone_id             = st.ColU64(2);
  r.status               = static_cast<flotilla::v1::BackendStatus>(st.ColI32(3));
  r.last_status_ms       = st.ColU64(4);
  r.last_keepalive_ms    = st.ColU64(5);
  r.expiration_ms        = st.ColOptU64(6);
  r.allowed_idle_seconds = st.ColOptU64(7);
  r.spawn_config_json    = st.ColText(8);
  r.key                  = st.ColText(9);
  return r;
}

model::EventRecord ReadEvent(const Statement& st) {
  model::EventRecord r;
  r.id           = st.ColU64(0);
  r.timestamp_ms = st.ColU64(1);
  if (!st.ColNull(2)) r.key = st.ColText(2);
  r.kind         = st.ColText(3);
  r.payload_json = st.ColText(4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema() {
  for (const auto& sql : sql::SqliteSchema()) {
    db_->Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Drones
// ------------------------------------------------------------------

Result SqliteRepository::InsertDrone(Transaction& t, model::DroneRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_DRONE);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.Text(1, r.cluster);
  st.Text(2, r.name);
  st.Text(3, r.controller);
  st.Text(4, r.version);
  st.Text(5, r.build_hash);
  st.I32(6, static_cast<int>(r.status));
  st.U64(7, r.last_heartbeat_ms);
  st.I32(8, r.draining ? 1 : 0);

  auto result = Translate(db, st.Step());
  if (result) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return result;
}

std::optional<model::DroneRecord> SqliteRepository::GetDrone(Transaction& t, uint64_t id) {
  Statement st(TX(t).Handle(), sql::SELECT_DRONE);
  st.RequireOk().U64(1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadDrone(st);
}

std::optional<model::DroneRecord> SqliteRepository::GetLiveDroneByName(Transaction& t, const std::string& cluster, const std::string& name) {
  Statement st(TX(t).Handle(), sql::SELECT_LIVE_DRONE_BY_NAME);
  st.RequireOk();
  st.Text(1, cluster);
  st.Text(2, name);
  if (!st.NextRow()) return std::nullopt;
  return ReadDrone(st);
}

std::vector<model::DroneRecord> SqliteRepository::ListDrones(Transaction& t, const DroneFilter& filter) {
  std::string sql = sql::SELECT_DRONES;
  sql += " WHERE 1=1";
  if (filter.cluster) sql += " AND cluster=?";
  if (!filter.include_terminated) sql += " AND status<>3";
  sql += " ORDER BY id ASC;";

  Statement st(TX(t).Handle(), sql);
  st.RequireOk();
  if (filter.cluster) st.Text(1, *filter.cluster);

  std::vector<model::DroneRecord> out;
  while (st.NextRow()) {
    out.push_back(ReadDrone(st));
  }
  return out;
}

Result SqliteRepository::UpdateDrone(Transaction& t, const model::DroneRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_DRONE);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.Text(1, r.cluster);
  st.Text(2, r.name);
  st.Text(3, r.controller);
  st.Text(4, r.version);
  st.Text(5, r.build_hash);
  st.I32(6, static_cast<int>(r.status));
  st.U64(7, r.last_heartbeat_ms);
  st.I32(8, r.draining ? 1 : 0);
  st.U64(9, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

Result SqliteRepository::InsertBackend(Transaction& t, const model::BackendRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_BACKEND);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.Text(1, r.id);
  st.Text(2, r.cluster);
  st.U64(3, r.drone_id);
  st.I32(4, static_cast<int>(r.status));
  st.U64(5, r.last_status_ms);
  st.U64(6, r.last_keepalive_ms);
  st.OptU64(7, r.expiration_ms);
  st.OptU64(8, r.allowed_idle_seconds);
  st.Text(9, r.spawn_config_json);
  st.Text(10, r.key);

  int rc = st.Step();
  if ((rc & 0xff) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  }
  return Translate(db, rc);
}

std::optional<model::BackendRecord> SqliteRepository::GetBackend(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_BACKEND);
  st.RequireOk().Text(1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadBackend(st);
}

std::vector<model::BackendRecord> SqliteRepository::ListBackends(Transaction& t, const BackendFilter& filter) {
  std::string sql = sql::SELECT_BACKENDS;
  sql += " WHERE 1=1";
  if (filter.cluster) sql += " AND cluster=?";
  if (filter.drone_id) sql += " AND drone_id=?";
  if (!filter.include_terminated) sql += " AND status<>6";
  sql += " ORDER BY id ASC;";

  Statement st(TX(t).Handle(), sql);
  st.RequireOk();
  int idx = 1;
  if (filter.cluster) st.Text(idx++, *filter.cluster);
  if (filter.drone_id) st.U64(idx++, *filter.drone_id);

  std::vector<model::BackendRecord> out;
  while (st.NextRow()) {
    out.push_back(ReadBackend(st));
  }
  return out;
}

Result SqliteRepository::UpdateBackend(Transaction& t, const model::BackendRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_BACKEND);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.Text(1, r.cluster);
  st.U64(2, r.drone_id);
  st.I32(3, static_cast<int>(r.status));
  st.U64(4, r.last_status_ms);
  st.U64(5, r.last_keepalive_ms);
  st.OptU64(6, r.expiration_ms);
  st.OptU64(7, r.allowed_idle_seconds);
  st.Text(8, r.spawn_config_json);
  st.Text(9, r.key);
  st.Text(10, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Key locks
// ------------------------------------------------------------------

std::optional<model::KeyLockRecord> SqliteRepository::GetKeyLock(Transaction& t, const std::string& cluster, const std::string& key) {
  Statement st(TX(t).Handle(), sql::SELECT_KEY_LOCK);
  st.RequireOk();
  st.Text(1, cluster);
  st.Text(2, key);
  if (!st.NextRow()) return std::nullopt;

  model::KeyLockRecord r;
  r.cluster        = st.ColText(0);
  r.key            = st.ColText(1);
  r.backend_id     = st.ColText(2);
  r.tag            = st.ColText(3);
  r.acquired_at_ms = st.ColU64(4);
  return r;
}

Result SqliteRepository::UpsertKeyLock(Transaction& t, const model::KeyLockRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_KEY_LOCK);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.Text(1, r.cluster);
  st.Text(2, r.key);
  st.Text(3, r.backend_id);
  st.Text(4, r.tag);
  st.U64(5, r.acquired_at_ms);
  return Translate(db, st.Step());
}

Result SqliteRepository::DeleteKeyLock(Transaction& t, const std::string& cluster, const std::string& key) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_KEY_LOCK);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.Text(1, cluster);
  st.Text(2, key);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_EVENT);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  if (r.timestamp_ms == 0) {
    r.timestamp_ms = NowMs();
  }
  st.U64(1, r.timestamp_ms);
  st.OptText(2, r.key);
  st.Text(3, r.kind);
  st.Text(4, r.payload_json);

  auto result = Translate(db, st.Step());
  if (result) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return result;
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, uint64_t after_id, const std::optional<std::string>& key,
                                                             std::optional<uint64_t> max_entries) {
  // LIMIT -1 means no limit in sqlite
  const auto limit = max_entries ? static_cast<sqlite3_int64>(*max_entries) : -1;

  Statement st(TX(t).Handle(), key ? sql::SELECT_KEY_EVENTS_AFTER : sql::SELECT_EVENTS_AFTER);
  st.RequireOk().U64(1, after_id);
  if (key) {
    st.Text(2, *key);
    st.I64(3, limit);
  } else {
    st.I64(2, limit);
  }

  std::vector<model::EventRecord> out;
  while (st.NextRow()) {
    out.push_back(ReadEvent(st));
  }
  return out;
}

std::optional<uint64_t> SqliteRepository::GetMaxEventId(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_MAX_EVENT_ID);
  st.RequireOk();
  if (!st.NextRow() || st.ColNull(0)) return std::nullopt;
  return st.ColU64(0);
}

Result SqliteRepository::TrimEventsToMaxCount(Transaction& t, uint64_t max_entries) {
  if (max_entries == 0) return Result::Ok();

  auto*     db = TX(t).Handle();
  Statement st(db, sql::TRIM_EVENTS);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  st.U64(1, max_entries - 1);
  return Translate(db, st.Step());
}

} // namespace flotilla::db::sqlite
