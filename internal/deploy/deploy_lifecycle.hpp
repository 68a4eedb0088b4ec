#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/deploy_record.hpp"

namespace shipyard::db {
class Repository;
}

namespace shipyard::deploy {

/*
  Deploy record lifecycle on top of the repository.

    Create         -> pending
    MarkRunning    pending -> running
    Complete       running -> success | failed   (once)
    CancelAbandoned pending|running -> cancelled

  Storage results are turned into util exceptions here. Complete and
  CancelAbandoned are the only terminal writers and both go through the
  repository's conditional update, so concurrent callers cannot apply a
  second terminal transition.
*/
class DeployLifecycle {
 public:
  explicit DeployLifecycle(std::shared_ptr<db::Repository> repository);

  db::model::DeployRecord Create(const std::optional<std::string>& service_id, const std::string& triggered_by,
                                 const std::string& commit_sha);

  void MarkRunning(const std::string& id, const std::string& logs_pointer);

  // Applies the terminal state if the record is still running. Returns the
  // updated record, or nullopt when the record had already left running
  // (another checker won, or it was cancelled).
  std::optional<db::model::DeployRecord> Complete(const std::string& id, shipyard::model::DeployStatus terminal,
                                                  const std::string& error_message);

  std::vector<std::string> CancelAbandoned(std::uint64_t older_than_seconds);

  std::optional<db::model::DeployRecord> Get(const std::string& id);
  std::optional<db::model::DeployRecord> FindByLogsPointer(const std::string& logs_pointer);
  std::vector<db::model::DeployRecord>   List(const db::model::DeployFilter& filter);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace shipyard::deploy
