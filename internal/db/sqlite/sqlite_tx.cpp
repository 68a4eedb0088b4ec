#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace shipyard::db::sqlite {

using shipyard::observability::StringField;

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), lock_(db_->LockForTransaction()), mode_(mode) {
  db_->Exec(mode_ == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    Rollback();
  } catch (const std::exception& e) {
    SHIPYARD_LOG_WARN("sqlite rollback failed", {StringField("path", db_->Path()), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    if (!e.IsBusy()) {
      throw;
    }
    // Still inside the transaction; undo it so the connection is usable.
    Rollback();
    throw TransactionConflict(e.what());
  }
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    Finish();
    throw;
  }
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

}
