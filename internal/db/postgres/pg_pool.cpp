#include "pg_pool.hpp"

#include <utility>

namespace flotilla::db::postgres {

namespace {

struct PreparedStatement {
  const char* name;
  const char* sql;
};

constexpr const char* kDroneColumns   = "id,cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining";
constexpr const char* kBackendColumns = "id,cluster,drone_id,status,last_status_ms,last_keepalive_ms,expiration_ms,allowed_idle_seconds,spawn_config::text,key";
constexpr const char* kEventColumns   = "id,timestamp_ms,key,kind,payload::text";

std::string Select(const char* columns, const char* rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

// Names used with exec_prepared in pg_repository.cpp.
void Prepare(pqxx::connection& conn) {
  const PreparedStatement writes[] = {
      {"insert_drone",
       "INSERT INTO drone(cluster,name,controller,version,build_hash,status,last_heartbeat_ms,draining) "
       "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id"},
      {"update_drone",
       "UPDATE drone SET cluster=$2,name=$3,controller=$4,version=$5,build_hash=$6,status=$7,last_heartbeat_ms=$8,draining=$9 WHERE id=$1"},
      {"insert_backend",
       "INSERT INTO backend(id,cluster,drone_id,status,last_status_ms,last_keepalive_ms,expiration_ms,allowed_idle_seconds,spawn_config,key) "
       "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9::jsonb,$10)"},
      {"update_backend",
       "UPDATE backend SET cluster=$2,drone_id=$3,status=$4,last_status_ms=$5,last_keepalive_ms=$6,expiration_ms=$7,"
       "allowed_idle_seconds=$8,spawn_config=$9::jsonb,key=$10 WHERE id=$1"},
      {"upsert_key_lock",
       "INSERT INTO backend_key(cluster,key,backend_id,tag,acquired_at_ms) VALUES($1,$2,$3,$4,$5) ON CONFLICT(cluster,key) DO UPDATE SET "
       "backend_id=EXCLUDED.backend_id,tag=EXCLUDED.tag,acquired_at_ms=EXCLUDED.acquired_at_ms"},
      {"delete_key_lock", "DELETE FROM backend_key WHERE cluster=$1 AND key=$2"},
      {"insert_event", "INSERT INTO event(timestamp_ms,key,kind,payload) VALUES($1,$2,$3,$4::jsonb) RETURNING id"},
      // keeps the newest $1 + 1 rows
      {"trim_events", "DELETE FROM event WHERE id < (SELECT id FROM event ORDER BY id DESC LIMIT 1 OFFSET $1)"},
      {"max_event_id", "SELECT MAX(id) FROM event"},
      {"get_key_lock", "SELECT cluster,key,backend_id,tag,acquired_at_ms FROM backend_key WHERE cluster=$1 AND key=$2"},
  };
  for (const auto& statement : writes) {
    conn.prepare(statement.name, statement.sql);
  }

  conn.prepare("get_drone", Select(kDroneColumns, "FROM drone WHERE id=$1"));
  conn.prepare("get_live_drone_by_name", Select(kDroneColumns, "FROM drone WHERE cluster=$1 AND name=$2 AND status<>3 ORDER BY id DESC LIMIT 1"));
  conn.prepare("get_backend", Select(kBackendColumns, "FROM backend WHERE id=$1"));
  conn.prepare("read_events", Select(kEventColumns, "FROM event WHERE id>$1 ORDER BY id ASC LIMIT $2"));
  conn.prepare("read_key_events", Select(kEventColumns, "FROM event WHERE id>$1 AND key=$2 ORDER BY id ASC LIMIT $3"));
}

} // namespace

PgPool::Lease::Lease(std::shared_ptr<PgPool> pool, std::unique_ptr<pqxx::connection> conn) : pool_(std::move(pool)), conn_(std::move(conn)) {
}

PgPool::Lease::~Lease() {
  if (pool_ && conn_) {
    pool_->Return(std::move(conn_));
  }
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

PgPool::Lease PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  released_.wait(lock, [this] { return !idle_.empty() || open_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(shared_from_this(), std::move(conn));
  }

  // reserve the slot, then connect without holding the lock
  ++open_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    Prepare(*conn);
  } catch (const std::exception&) {
    Return(nullptr);
    throw;
  }
  return Lease(shared_from_this(), std::move(conn));
}

void PgPool::Return(std::unique_ptr<pqxx::connection> conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn && conn->is_open()) {
      idle_.push_back(std::move(conn));
    } else {
      --open_;
    }
  }
  released_.notify_one();
}

} // namespace flotilla::db::postgres
