#include "allowlist_guard.hpp"

#include "internal/audit/audit_trail.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::allowlist {

using shipyard::observability::StringField;

namespace {

std::string Describe(AllowlistKind kind) {
  switch (kind) {
    case AllowlistKind::kRepoPath:
      return "repository path";
    case AllowlistKind::kComposeProject:
      return "compose project";
    case AllowlistKind::kContainerName:
      return "container name";
  }
  return "target";
}

} // namespace

AllowlistGuard::AllowlistGuard(std::shared_ptr<AllowlistStore> store, std::shared_ptr<audit::AuditTrail> audit)
    : store_(std::move(store)), audit_(std::move(audit)) {
}

bool AllowlistGuard::IsAllowed(AllowlistKind kind, std::string_view value) const {
  return store_->Contains(kind, value);
}

void AllowlistGuard::Require(AllowlistKind kind, const std::string& value, const std::string& actor, const std::string& action) const {
  if (IsAllowed(kind, value)) {
    return;
  }

  const auto reason = "operation not allowed: " + Describe(kind) + " not in allowlist: " + value;
  SHIPYARD_LOG_WARN("allowlist denial", {StringField("kind", ToString(kind)), StringField("value", value), StringField("actor", actor),
                                         StringField("action", action)});
  shipyard::observability::Metrics::Instance().RecordGuardDenial(ToString(kind));
  if (audit_) {
    audit_->Record(actor, action, std::string(ToString(kind)), value, db::model::AuditOutcome::kBlocked, reason);
  }
  throw util::OperationBlocked(reason);
}

} // namespace shipyard::allowlist
