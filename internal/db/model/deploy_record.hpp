#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/deploy_state.hpp"

namespace shipyard::db::model {

/*
  Persistent deploy row. One per deployment attempt.

  IMPORTANT:
  - status leaves running exactly once (CompleteIfRunning).
  - completed_at_ms is unset until a terminal state is reached.
  - error_message is only set on failed.
*/

struct DeployRecord {
  std::string id; // UUID

  // nullable: not every deploy maps to a catalog service
  std::optional<std::string> service_id;

  shipyard::model::DeployStatus status = shipyard::model::DeployStatus::kPending;

  uint64_t                started_at_ms = 0;
  std::optional<uint64_t> completed_at_ms;

  std::string commit_sha;
  std::string logs_pointer;
  std::string error_message;
  std::string triggered_by;
};

struct DeployFilter {
  std::optional<shipyard::model::DeployStatus> status;
  std::optional<std::string>                   service_id;
  std::size_t                                  limit = 50;
};

} // namespace shipyard::db::model
