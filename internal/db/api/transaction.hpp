#pragma once

#include <stdexcept>
#include <string>

namespace flotilla::db {

// A concurrent transaction committed first. Nothing from the losing
// transaction was applied and the caller may run it again.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Unit of work over one repository.

  Every read and write of a repository call goes through the transaction it
  is given. Writes become visible to other transactions at Commit() and are
  discarded by Rollback() or by destroying an open transaction.

  Each engine enforces isolation its own way:
    memory    one transaction at a time, undo journal on rollback
    sqlite    BEGIN IMMEDIATE on a single connection
    postgres  SERIALIZABLE on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  // Throws TransactionConflict if a concurrent writer won. The transaction
  // stays open after a failed commit; it is rolled back on destruction.
  void Commit() {
    if (finished_) {
      throw std::logic_error("commit on a finished transaction");
    }
    DoCommit();
    finished_ = true;
  }

  // No-op once the transaction has finished.
  void Rollback() {
    if (finished_) return;
    finished_ = true;
    DoRollback();
  }

  bool IsOpen() const {
    return !finished_;
  }

 protected:
  Transaction() = default;

  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

 private:
  bool finished_ = false;
};

} // namespace flotilla::db
