#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace flotilla::db::sqlite {

// Holds the connection's transaction mutex from BEGIN IMMEDIATE to
// COMMIT or ROLLBACK. Taking the write lock up front makes two connects on
// the same key serialize at Begin() rather than fail at commit.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 private:
  void DoCommit() override;
  void DoRollback() override;

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
};

} // namespace flotilla::db::sqlite
