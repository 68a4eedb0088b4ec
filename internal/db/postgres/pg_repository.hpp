#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace shipyard::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static PgTransaction& WriteTX(Transaction& t, const char* op);
  static Result Translate(const std::exception& e);
  static Result MissOrConflict(PgTransaction& tx, const std::string& id, const char* expected);
};

}
