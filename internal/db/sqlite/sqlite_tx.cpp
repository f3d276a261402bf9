#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace flotilla::db::sqlite {

namespace {

// Another process holds the database lock past the busy timeout.
void ExecOrConflict(SqliteDB& db, const char* sql) {
  try {
    db.Exec(sql);
  } catch (const SqliteError& e) {
    if (e.code() == SQLITE_BUSY || e.code() == SQLITE_LOCKED) {
      throw TransactionConflict(e.what());
    }
    throw;
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TxMutex()) {
  ExecOrConflict(*db_, "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!IsOpen()) return;

  // sqlite may already have rolled back after a failed statement
  if (sqlite3_get_autocommit(db_->Handle()) != 0) return;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    FLOTILLA_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                 observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::DoCommit() {
  ExecOrConflict(*db_, "COMMIT;");
  guard_.unlock();
}

void SqliteTransaction::DoRollback() {
  if (sqlite3_get_autocommit(db_->Handle()) == 0) {
    db_->Exec("ROLLBACK;");
  }
  guard_.unlock();
}

} // namespace flotilla::db::sqlite
