#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace shipyard::db::sqlite {

/*
  kWrite takes the database write lock up front (BEGIN IMMEDIATE) so a
  compare-and-swap on deploy status never upgrades a read lock mid-way.
  kRead is BEGIN DEFERRED.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  void Finish();

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  TxMode                       mode_;
  bool committed_ = false;
  bool finished_ = false;
};

}
