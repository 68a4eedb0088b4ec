#pragma once

#include <stdexcept>
#include <string>

namespace shipyard::db {

// Status lookups and listings run as kRead so polling never queues
// behind a deploy being created or completed.
enum class TxMode {
  kRead,
  kWrite,
};

/*
  Unit of work against the deploy record store.

  - Writes are invisible to other transactions until Commit()
  - Destruction without Commit() rolls back
  - Writing through a kRead transaction is a programming error

  SQLite:   BEGIN DEFERRED (read) / BEGIN IMMEDIATE (write)
  Postgres: pqxx::read_transaction / pqxx::work
  Memory:   snapshot, copied back on commit
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool   IsCommitted() const = 0;
  virtual TxMode Mode() const = 0;
};

// Thrown by Commit() when a concurrent writer invalidated this transaction.
// The caller re-reads and decides again.
class TransactionConflict : public std::runtime_error {
public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {}
};

// Thrown when a write is attempted through a kRead transaction.
class ReadOnlyTransaction : public std::logic_error {
public:
  explicit ReadOnlyTransaction(const std::string& what) : std::logic_error("write through read-only transaction: " + what) {}
};

}
