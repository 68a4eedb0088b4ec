#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace shipyard::db::postgres {

/*
  Holds one pooled connection for its whole lifetime.

  kWrite runs as pqxx::work, kRead as pqxx::read_transaction; both are
  driven through pqxx::transaction_base.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  TxMode                                  mode_;
  bool committed_ = false;
  bool finished_ = false;
};

}
