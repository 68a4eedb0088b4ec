#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace shipyard::db::postgres {

using shipyard::observability::StringField;

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode) : conn_(pool->Acquire()), mode_(mode) {
  if (mode_ == TxMode::kWrite) {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      SHIPYARD_LOG_WARN("postgres rollback failed", {StringField("error", e.what())});
    }
  }
  // The transaction must end before its connection goes back to the pool.
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    // serialization_failure and deadlock_detected: the server already rolled back.
    finished_ = true;
    throw TransactionConflict(e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  tx_->abort();
}

}
