#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace flotilla::db::postgres {

// SERIALIZABLE transaction on a leased connection. Postgres aborts one of
// two connects racing on the same key lock with a serialization failure,
// which Commit() reports as TransactionConflict.
class PgTransaction final : public db::Transaction {
 public:
  using Work = pqxx::transaction<pqxx::isolation_level::serializable>;

  explicit PgTransaction(PgPool& pool);
  ~PgTransaction() override;

  Work& Tx() {
    return *work_;
  }

 private:
  void DoCommit() override;
  void DoRollback() override;

  // declared first so the work is destroyed before its connection returns
  PgPool::Lease         conn_;
  std::unique_ptr<Work> work_;
};

} // namespace flotilla::db::postgres
