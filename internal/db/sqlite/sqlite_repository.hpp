#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace shipyard::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) override;

  Result InsertDeploy(Transaction&, const model::DeployRecord&) override;
  std::optional<model::DeployRecord> GetDeploy(Transaction&, const std::string&) override;
  std::optional<model::DeployRecord> FindDeployByLogsPointer(Transaction&, const std::string&) override;
  std::vector<model::DeployRecord> ListDeploys(Transaction&, const model::DeployFilter&) override;
  Result MarkRunning(Transaction&, const std::string& id, const std::string& logs_pointer) override;
  Result CompleteIfRunning(Transaction&, const std::string& id, shipyard::model::DeployStatus terminal,
                           uint64_t completed_at_ms, const std::string& error_message) override;
  Result CancelAbandoned(Transaction&, uint64_t started_before_ms, uint64_t completed_at_ms,
                         std::vector<std::string>& cancelled_ids) override;

  Result InsertAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, std::size_t limit) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static SqliteTransaction& WriteTX(Transaction& t, const char* op);
  static Result Translate(sqlite3* db, int rc);
  // Distinguishes NotFound from Conflict after a conditional update touched no row.
  static Result MissOrConflict(sqlite3* db, const std::string& id, const char* expected);
};

}
