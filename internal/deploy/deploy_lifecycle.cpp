#include "deploy_lifecycle.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace shipyard::deploy {

using shipyard::model::DeployStatus;
using shipyard::observability::IntField;
using shipyard::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + " (" + db::ToString(result.code) + ")" + (result.message.empty() ? "" : ": " + result.message);
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

constexpr int kCommitAttempts = 3;

} // namespace

DeployLifecycle::DeployLifecycle(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::DeployRecord DeployLifecycle::Create(const std::optional<std::string>& service_id, const std::string& triggered_by,
                                                const std::string& commit_sha) {
  db::model::DeployRecord record;
  record.id            = util::NewId();
  record.service_id    = service_id;
  record.status        = DeployStatus::kPending;
  record.started_at_ms = util::NowMillis();
  record.commit_sha    = commit_sha;
  record.triggered_by  = triggered_by;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertDeploy(*tx, record), "create deploy");
  tx->Commit();

  SHIPYARD_LOG_INFO("deploy record created", {StringField("deploy_id", record.id), StringField("actor", triggered_by)});
  return record;
}

void DeployLifecycle::MarkRunning(const std::string& id, const std::string& logs_pointer) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->MarkRunning(*tx, id, logs_pointer), "mark deploy running");
  tx->Commit();
}

std::optional<db::model::DeployRecord> DeployLifecycle::Complete(const std::string& id, DeployStatus terminal,
                                                                 const std::string& error_message) {
  if (!shipyard::model::IsTerminal(terminal) || terminal == DeployStatus::kCancelled) {
    throw util::InvalidArgument("completion requires success or failed");
  }

  for (int attempt = 0; attempt < kCommitAttempts; ++attempt) {
    try {
      auto tx      = repository_->Begin();
      auto current = repository_->GetDeploy(*tx, id);
      if (!current) {
        throw util::NotFound("deploy not found: " + id);
      }
      if (current->status != DeployStatus::kRunning) {
        tx->Rollback();
        return std::nullopt;
      }

      const auto completed_at_ms = util::NowMillis();
      const auto stored_error    = terminal == DeployStatus::kFailed ? error_message : std::string{};
      auto       result          = repository_->CompleteIfRunning(*tx, id, terminal, completed_at_ms, stored_error);
      if (result.code == db::ErrorCode::Conflict) {
        tx->Rollback();
        return std::nullopt;
      }
      if (result.Retryable()) {
        tx->Rollback();
        SHIPYARD_LOG_DEBUG("deploy completion retrying", {StringField("deploy_id", id), StringField("reason", db::ToString(result.code))});
        continue;
      }
      ThrowIfDbError(result, "complete deploy");
      tx->Commit();

      current->status          = terminal;
      current->completed_at_ms = completed_at_ms;
      current->error_message   = stored_error;

      shipyard::observability::Metrics::Instance().RecordDeployOutcome(shipyard::model::ToString(terminal));
      SHIPYARD_LOG_INFO("deploy completed", {StringField("deploy_id", id), StringField("status", shipyard::model::ToString(terminal)),
                                             StringField("error", stored_error)});
      return current;
    } catch (const db::TransactionConflict&) {
      // A concurrent writer committed first; re-read and decide again.
      SHIPYARD_LOG_DEBUG("deploy completion conflicted", {StringField("deploy_id", id), IntField("attempt", attempt)});
    }
  }
  throw util::InvalidState("deploy " + id + " is being completed concurrently");
}

std::vector<std::string> DeployLifecycle::CancelAbandoned(std::uint64_t older_than_seconds) {
  const auto now_ms    = util::NowMillis();
  const auto cutoff_ms = now_ms > older_than_seconds * 1000 ? now_ms - older_than_seconds * 1000 : 0;

  std::vector<std::string> cancelled;
  auto                     tx = repository_->Begin();
  ThrowIfDbError(repository_->CancelAbandoned(*tx, cutoff_ms, now_ms, cancelled), "cancel abandoned deploys");
  tx->Commit();

  for (const auto& id : cancelled) {
    shipyard::observability::Metrics::Instance().RecordDeployOutcome(shipyard::model::ToString(DeployStatus::kCancelled));
    SHIPYARD_LOG_INFO("deploy cancelled", {StringField("deploy_id", id)});
  }
  return cancelled;
}

std::optional<db::model::DeployRecord> DeployLifecycle::Get(const std::string& id) {
  auto tx     = repository_->Begin(db::TxMode::kRead);
  auto record = repository_->GetDeploy(*tx, id);
  tx->Commit();
  return record;
}

std::optional<db::model::DeployRecord> DeployLifecycle::FindByLogsPointer(const std::string& logs_pointer) {
  auto tx     = repository_->Begin(db::TxMode::kRead);
  auto record = repository_->FindDeployByLogsPointer(*tx, logs_pointer);
  tx->Commit();
  return record;
}

std::vector<db::model::DeployRecord> DeployLifecycle::List(const db::model::DeployFilter& filter) {
  auto tx      = repository_->Begin(db::TxMode::kRead);
  auto records = repository_->ListDeploys(*tx, filter);
  tx->Commit();
  return records;
}

} // namespace shipyard::deploy
