#include "audit_trail.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace shipyard::audit {

using shipyard::observability::StringField;

AuditTrail::AuditTrail(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void AuditTrail::TryInsert(const db::model::AuditRecord& record) {
  auto tx = repository_->Begin();
  if (auto r = repository_->InsertAudit(*tx, record); !r) {
    SHIPYARD_LOG_ERROR("audit insert failed", {StringField("action", record.action), StringField("error", r.message)});
    tx->Rollback();
    return;
  }
  tx->Commit();
}

void AuditTrail::Record(const std::string& actor, const std::string& action, const std::string& entity_type, const std::string& entity_id,
                        db::model::AuditOutcome outcome, const std::string& detail) {
  db::model::AuditRecord record;
  record.id          = util::NewId();
  record.at_ms       = util::NowMillis();
  record.actor       = actor;
  record.action      = action;
  record.entity_type = entity_type;
  record.entity_id   = entity_id;
  record.outcome     = outcome;
  record.detail      = detail;

  for (int attempt = 0; attempt < 2; ++attempt) {
    try {
      TryInsert(record);
      return;
    } catch (const db::TransactionConflict&) {
      SHIPYARD_LOG_WARN("audit insert conflicted, retrying", {StringField("action", action)});
    } catch (const std::exception& e) {
      SHIPYARD_LOG_ERROR("audit insert failed", {StringField("action", action), StringField("error", e.what())});
      return;
    }
  }
  SHIPYARD_LOG_ERROR("audit entry dropped after conflict", {StringField("action", action), StringField("entity_id", entity_id)});
}

std::vector<db::model::AuditRecord> AuditTrail::Recent(std::size_t limit) {
  auto tx      = repository_->Begin(db::TxMode::kRead);
  auto records = repository_->ListAudit(*tx, limit);
  tx->Commit();
  return records;
}

} // namespace shipyard::audit
