#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/deploy_record.hpp"

namespace shipyard::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - MarkRunning / CompleteIfRunning / CancelAbandoned are conditional
    updates: they only touch rows still in the expected status and
    report Conflict otherwise. Concurrent completion checks rely on this.

  The DB is the source of truth for:
    deploy records
    audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) = 0;

  // ---------------------------------------------------------------------
  // Deploy records
  // ---------------------------------------------------------------------

  virtual Result InsertDeploy(Transaction&, const model::DeployRecord&) = 0;

  virtual std::optional<model::DeployRecord> GetDeploy(Transaction&, const std::string& id) = 0;

  // Most recent record launched with this log file.
  virtual std::optional<model::DeployRecord> FindDeployByLogsPointer(Transaction&, const std::string& logs_pointer) = 0;

  // Newest first.
  virtual std::vector<model::DeployRecord> ListDeploys(Transaction&, const model::DeployFilter&) = 0;

  // pending -> running. Conflict if the record is not pending.
  virtual Result MarkRunning(Transaction&, const std::string& id, const std::string& logs_pointer) = 0;

  // running -> terminal. Conflict if the record is no longer running.
  virtual Result CompleteIfRunning(Transaction&, const std::string& id, shipyard::model::DeployStatus terminal, uint64_t completed_at_ms,
                                   const std::string& error_message) = 0;

  // pending/running records started before the cutoff -> cancelled.
  virtual Result CancelAbandoned(Transaction&, uint64_t started_before_ms, uint64_t completed_at_ms, std::vector<std::string>& cancelled_ids) = 0;

  // ---------------------------------------------------------------------
  // Audit trail
  // ---------------------------------------------------------------------

  virtual Result InsertAudit(Transaction&, const model::AuditRecord&) = 0;

  // Newest first.
  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, std::size_t limit) = 0;
};

} // namespace shipyard::db
