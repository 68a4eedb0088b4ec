#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace shipyard::db::memory {

/*
  Snapshot of the committed state plus local edits.

  Optimistic: Commit() fails with TransactionConflict when another
  write transaction committed after the snapshot was taken. Read
  transactions never conflict and never publish.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  TxMode Mode() const override {
    return mode_;
  }

  // op names the repository call for the read-only error.
  MemoryRepository::State& Mutable(const char* op);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  TxMode                  mode_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace shipyard::db::memory
