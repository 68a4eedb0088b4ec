#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/audit_record.hpp"

namespace shipyard::db {
class Repository;
}

namespace shipyard::audit {

/*
  Append-only audit trail on top of the repository.

  Writing an audit entry never fails the operation being audited: storage
  errors are logged and the entry is dropped.
*/
class AuditTrail {
 public:
  explicit AuditTrail(std::shared_ptr<db::Repository> repository);

  void Record(const std::string& actor, const std::string& action, const std::string& entity_type, const std::string& entity_id,
              db::model::AuditOutcome outcome, const std::string& detail = {});

  std::vector<db::model::AuditRecord> Recent(std::size_t limit);

 private:
  void TryInsert(const db::model::AuditRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace shipyard::audit
