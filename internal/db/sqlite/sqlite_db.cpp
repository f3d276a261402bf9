#include "sqlite_db.hpp"

namespace flotilla::db::sqlite {

namespace {

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr);
  if (rc != SQLITE_OK) {
    // sqlite hands back a handle carrying the error even when open fails
    const std::string msg = "open " + path_ + ": " + (db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, msg);
  }

  try {
    ApplyPragmas(options);
  } catch (const SqliteError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string msg = err != nullptr ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw SqliteError(rc, msg);
}

void SqliteDB::ApplyPragmas(const SqliteOptions& options) {
  if (options.write_ahead_log && !InMemory()) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }
  // backend and key lock rows reference their drone and backend
  Exec("PRAGMA foreign_keys=ON;");

  const int rc = sqlite3_busy_timeout(db_, options.busy_timeout_ms);
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace flotilla::db::sqlite
