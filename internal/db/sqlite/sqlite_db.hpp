#pragma once

#include <sqlite3.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace shipyard::db::sqlite {

// Failure reported by sqlite3; code is the primary result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

  bool IsBusy() const {
    return code_ == SQLITE_BUSY || code_ == SQLITE_LOCKED;
  }

 private:
  int code_;
};

/*
  The deploy store's single sqlite3 connection.

  A connection carries at most one open transaction, so every
  SqliteTransaction holds the transaction lock from BEGIN until
  COMMIT/ROLLBACK. Different threads (RPC handlers, the status poller)
  therefore take turns instead of failing with "cannot start a
  transaction within a transaction".
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results (schema bootstrap, BEGIN/COMMIT).
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::unique_lock<std::mutex> LockForTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace shipyard::db::sqlite
