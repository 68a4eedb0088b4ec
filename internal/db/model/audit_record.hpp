#pragma once

#include <cstdint>
#include <string>

namespace shipyard::db::model {

enum class AuditOutcome : std::uint8_t {
  kOk      = 1,
  kBlocked = 2,
  kFailed  = 3,
};

inline const char* ToString(AuditOutcome outcome) {
  switch (outcome) {
    case AuditOutcome::kOk:
      return "ok";
    case AuditOutcome::kBlocked:
      return "blocked";
    case AuditOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  Append-only audit row.

  Blocked operations are kept distinct from ordinary failures so that
  allowlist denials can be reviewed on their own.
*/
struct AuditRecord {
  std::string  id;
  uint64_t     at_ms = 0;
  std::string  actor;
  std::string  action;      // deploy.start, allowlist.update, container.restart ...
  std::string  entity_type; // deploy, service, repo_path, container_name ...
  std::string  entity_id;
  AuditOutcome outcome = AuditOutcome::kOk;
  std::string  detail;
};

} // namespace shipyard::db::model
