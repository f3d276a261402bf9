#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace flotilla::db::postgres {

PgTransaction::PgTransaction(PgPool& pool) : conn_(pool.Acquire()), work_(std::make_unique<Work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!IsOpen()) return;

  try {
    work_->abort();
  } catch (const pqxx::failure& e) {
    FLOTILLA_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::DoCommit() {
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw TransactionConflict(e.what());
  }
}

void PgTransaction::DoRollback() {
  work_->abort();
}

} // namespace flotilla::db::postgres
