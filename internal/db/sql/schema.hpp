#pragma once

#include <string>
#include <vector>

namespace flotilla::db::sql {

/*
  Schema bootstrap, applied at startup with IF NOT EXISTS.

  At most one non-terminated drone row per (cluster, name): status 3 is
  DRONE_STATUS_TERMINATED.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS drone (id INTEGER PRIMARY KEY AUTOINCREMENT, cluster TEXT NOT NULL, name TEXT NOT NULL, controller TEXT NOT NULL, "
      "version TEXT NOT NULL DEFAULT '', build_hash TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, last_heartbeat_ms INTEGER NOT NULL, "
      "draining INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS drone_live_name ON drone(cluster, name) WHERE status <> 3;",
      "CREATE TABLE IF NOT EXISTS backend (id TEXT PRIMARY KEY, cluster TEXT NOT NULL, drone_id INTEGER NOT NULL REFERENCES drone(id), "
      "status INTEGER NOT NULL, last_status_ms INTEGER NOT NULL, last_keepalive_ms INTEGER NOT NULL, expiration_ms INTEGER, "
      "allowed_idle_seconds INTEGER, spawn_config TEXT NOT NULL, key TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS backend_drone ON backend(drone_id);",
      "CREATE TABLE IF NOT EXISTS backend_key (cluster TEXT NOT NULL, key TEXT NOT NULL, backend_id TEXT NOT NULL REFERENCES backend(id), "
      "tag TEXT NOT NULL, acquired_at_ms INTEGER NOT NULL, PRIMARY KEY (cluster, key));",
      "CREATE TABLE IF NOT EXISTS event (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp_ms INTEGER NOT NULL, key TEXT, kind TEXT NOT NULL, "
      "payload TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS event_key ON event(key, id);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS drone (id BIGSERIAL PRIMARY KEY, cluster TEXT NOT NULL, name TEXT NOT NULL, controller TEXT NOT NULL, "
      "version TEXT NOT NULL DEFAULT '', build_hash TEXT NOT NULL DEFAULT '', status SMALLINT NOT NULL, last_heartbeat_ms BIGINT NOT NULL, "
      "draining BOOLEAN NOT NULL DEFAULT FALSE);",
      "CREATE UNIQUE INDEX IF NOT EXISTS drone_live_name ON drone(cluster, name) WHERE status <> 3;",
      "CREATE TABLE IF NOT EXISTS backend (id TEXT PRIMARY KEY, cluster TEXT NOT NULL, drone_id BIGINT NOT NULL REFERENCES drone(id), "
      "status SMALLINT NOT NULL, last_status_ms BIGINT NOT NULL, last_keepalive_ms BIGINT NOT NULL, expiration_ms BIGINT, "
      "allowed_idle_seconds BIGINT, spawn_config JSONB NOT NULL, key TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS backend_drone ON backend(drone_id);",
      "CREATE TABLE IF NOT EXISTS backend_key (cluster TEXT NOT NULL, key TEXT NOT NULL, backend_id TEXT NOT NULL REFERENCES backend(id), "
      "tag TEXT NOT NULL, acquired_at_ms BIGINT NOT NULL, PRIMARY KEY (cluster, key));",
      "CREATE TABLE IF NOT EXISTS event (id BIGSERIAL PRIMARY KEY, timestamp_ms BIGINT NOT NULL, key TEXT, kind TEXT NOT NULL, "
      "payload JSONB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS event_key ON event(key, id);"};
  return kSchema;
}

} // namespace flotilla::db::sql
