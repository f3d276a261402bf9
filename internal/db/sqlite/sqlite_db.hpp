#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace flotilla::db::sqlite {

class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  // primary result code (SQLITE_BUSY, SQLITE_CONSTRAINT, ...)
  int code() const {
    return code_ & 0xff;
  }

 private:
  int code_;
};

struct SqliteOptions {
  // how long a writer waits for another process's lock before SQLITE_BUSY
  int busy_timeout_ms = 5000;

  // ignored for ":memory:"
  bool write_ahead_log = true;
};

// One sqlite3 connection shared by every transaction of the controller.
// Transactions take TxMutex() so at most one is open at a time.
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  // Runs one or more statements without results; throws SqliteError.
  void Exec(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  void ApplyPragmas(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace flotilla::db::sqlite
