#include "rpc_support.hpp"

#include "internal/auth/privilege_gate.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace shipyard::service {

using shipyard::model::DeployStatus;

std::string RequireSession(const ServiceContext& ctx, const CallerCredentials& credentials) {
  return ctx.privileges->VerifySession(credentials.session_token);
}

std::string RequireAnyCaller(const ServiceContext& ctx, const CallerCredentials& credentials) {
  if (!credentials.internal_token.empty() && ctx.privileges->VerifyInternal(credentials.internal_token)) {
    return "system";
  }
  return ctx.privileges->VerifySession(credentials.session_token);
}

shipyard::v1::DeployStatus ToProto(DeployStatus status) {
  switch (status) {
    case DeployStatus::kPending:
      return shipyard::v1::DEPLOY_STATUS_PENDING;
    case DeployStatus::kRunning:
      return shipyard::v1::DEPLOY_STATUS_RUNNING;
    case DeployStatus::kSuccess:
      return shipyard::v1::DEPLOY_STATUS_SUCCESS;
    case DeployStatus::kFailed:
      return shipyard::v1::DEPLOY_STATUS_FAILED;
    case DeployStatus::kCancelled:
      return shipyard::v1::DEPLOY_STATUS_CANCELLED;
  }
  return shipyard::v1::DEPLOY_STATUS_UNSPECIFIED;
}

std::optional<DeployStatus> FromProto(shipyard::v1::DeployStatus status) {
  switch (status) {
    case shipyard::v1::DEPLOY_STATUS_PENDING:
      return DeployStatus::kPending;
    case shipyard::v1::DEPLOY_STATUS_RUNNING:
      return DeployStatus::kRunning;
    case shipyard::v1::DEPLOY_STATUS_SUCCESS:
      return DeployStatus::kSuccess;
    case shipyard::v1::DEPLOY_STATUS_FAILED:
      return DeployStatus::kFailed;
    case shipyard::v1::DEPLOY_STATUS_CANCELLED:
      return DeployStatus::kCancelled;
    default:
      return std::nullopt;
  }
}

shipyard::v1::DeployRecord ToProto(const db::model::DeployRecord& record) {
  shipyard::v1::DeployRecord out;
  out.set_id(record.id);
  out.set_service_id(record.service_id.value_or(""));
  out.set_status(ToProto(record.status));
  *out.mutable_started_at() = util::TimestampFromMillis(record.started_at_ms);
  if (record.completed_at_ms) {
    *out.mutable_completed_at() = util::TimestampFromMillis(*record.completed_at_ms);
  }
  out.set_commit_sha(record.commit_sha);
  out.set_logs_pointer(record.logs_pointer);
  out.set_error_message(record.error_message);
  out.set_triggered_by(record.triggered_by);
  return out;
}

shipyard::v1::AuditEvent ToProto(const db::model::AuditRecord& record) {
  shipyard::v1::AuditEvent out;
  out.set_id(record.id);
  *out.mutable_at() = util::TimestampFromMillis(record.at_ms);
  out.set_actor(record.actor);
  out.set_action(record.action);
  out.set_entity_type(record.entity_type);
  out.set_entity_id(record.entity_id);
  switch (record.outcome) {
    case db::model::AuditOutcome::kOk:
      out.set_outcome(shipyard::v1::AUDIT_OUTCOME_OK);
      break;
    case db::model::AuditOutcome::kBlocked:
      out.set_outcome(shipyard::v1::AUDIT_OUTCOME_BLOCKED);
      break;
    case db::model::AuditOutcome::kFailed:
      out.set_outcome(shipyard::v1::AUDIT_OUTCOME_FAILED);
      break;
  }
  out.set_detail(record.detail);
  return out;
}

} // namespace shipyard::service
