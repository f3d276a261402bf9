#pragma once

namespace flotilla::db::sql {

/*
  Canonical SQL used by the SQLite repository.

  The Postgres repository prepares the same statements with $n
  placeholders in PgPool::PrepareStatements().
*/

// drones

static constexpr const char* INSERT_DRONE =
    "INSERT INTO drone(cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_DRONES =
    "SELECT id,cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining FROM drone";

static constexpr const char* SELECT_DRONE =
    "SELECT id,cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining"
    " FROM drone WHERE id=?;";

static constexpr const char* SELECT_LIVE_DRONE_BY_NAME =
    "SELECT id,cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining"
    " FROM drone WHERE cluster=? AND name=? AND status<>3 ORDER BY id DESC LIMIT 1;";

static constexpr const char* UPDATE_DRONE =
    "UPDATE drone SET cluster=?,name=?,controller=?,version=?,build_hash=?,status=?,last_heartbeat_ms=?,draining=?"
    " WHERE id=?;";

// backends

static constexpr const char* INSERT_BACKEND =
    "INSERT INTO backend(id,cluster,drone_id,status,last_status_ms,last_keepalive_ms,expiration_ms,allowed_idle_seconds,spawn_config,key)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BACKENDS =
    "SELECT id,cluster,drone_id,status,last_status_ms,last_keepalive_ms,expiration_ms,allowed_idle_seconds,spawn_config,key FROM backend";

static constexpr const char* SELECT_BACKEND =
    "SELECT id,cluster,drone_id,status,last_status_ms,last_keepalive_ms,expiration_ms,allowed_idle_seconds,spawn_config,key"
    " FROM backend WHERE id=?;";

static constexpr const char* UPDATE_BACKEND =
    "UPDATE backend SET cluster=?,drone_id=?,status=?,last_status_ms=?,last_keepalive_ms=?,expiration_ms=?,allowed_idle_seconds=?,"
    "spawn_config=?,key=? WHERE id=?;";

// key locks

static constexpr const char* SELECT_KEY_LOCK =
    "SELECT cluster,key,backend_id,tag,acquired_at_ms FROM backend_key WHERE cluster=? AND key=?;";

static constexpr const char* UPSERT_KEY_LOCK =
    "INSERT INTO backend_key(cluster,key,backend_id,tag,acquired_at_ms) VALUES(?,?,?,?,?)"
    " ON CONFLICT(cluster,key) DO UPDATE SET"
    " backend_id=excluded.backend_id,"
    " tag=excluded.tag,"
    " acquired_at_ms=excluded.acquired_at_ms;";

static constexpr const char* DELETE_KEY_LOCK =
    "DELETE FROM backend_key WHERE cluster=? AND key=?;";

// events

static constexpr const char* INSERT_EVENT =
    "INSERT INTO event(timestamp_ms,key,kind,payload) VALUES(?,?,?,?);";

static constexpr const char* SELECT_EVENTS_AFTER =
    "SELECT id,timestamp_ms,key,kind,payload FROM event WHERE id>? ORDER BY id ASC LIMIT ?;";

static constexpr const char* SELECT_KEY_EVENTS_AFTER =
    "SELECT id,timestamp_ms,key,kind,payload FROM event WHERE id>? AND key=? ORDER BY id ASC LIMIT ?;";

static constexpr const char* SELECT_MAX_EVENT_ID =
    "SELECT MAX(id) FROM event;";

// bound with max_entries - 1; keeps the newest max_entries rows
static constexpr const char* TRIM_EVENTS =
    "DELETE FROM event WHERE id < (SELECT id FROM event ORDER BY id DESC LIMIT 1 OFFSET ?);";

}
