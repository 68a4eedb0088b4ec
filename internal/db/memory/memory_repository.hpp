#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace shipyard::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::DeployRecord> deploys;
    // insertion order, used for newest-first listings
    std::vector<std::string> deploy_order;
    std::vector<model::AuditRecord> audit;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
