#include "pg_repository.hpp"

namespace shipyard::db::postgres {

using shipyard::model::DeployStatus;

namespace {

model::DeployRecord ReadDeploy(const pqxx::row& row) {
  model::DeployRecord r;
  r.id = row[0].c_str();
  if (!row[1].is_null()) r.service_id = row[1].c_str();
  r.status        = shipyard::model::ParseDeployStatus(row[2].c_str()).value_or(DeployStatus::kPending);
  r.started_at_ms = row[3].as<uint64_t>();
  if (!row[4].is_null()) r.completed_at_ms = row[4].as<uint64_t>();
  r.commit_sha    = row[5].c_str();
  r.logs_pointer  = row[6].c_str();
  r.error_message = row[7].c_str();
  r.triggered_by  = row[8].c_str();
  return r;
}

model::AuditOutcome ParseOutcome(const std::string& value) {
  if (value == "blocked") return model::AuditOutcome::kBlocked;
  if (value == "failed") return model::AuditOutcome::kFailed;
  return model::AuditOutcome::kOk;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(TxMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

PgTransaction& PgRepository::WriteTX(Transaction& t, const char* op) {
  if (t.Mode() != TxMode::kWrite) throw ReadOnlyTransaction(op);
  return TX(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::MissOrConflict(PgTransaction& tx, const std::string& id, const char* expected) {
  auto res = tx.Work().exec_prepared("deploy_status", id);
  if (res.empty()) return Result::Err(ErrorCode::NotFound, "deploy " + id);
  return Result::Err(ErrorCode::Conflict, "deploy " + id + " is not " + expected);
}

Result PgRepository::InsertDeploy(Transaction& t, const model::DeployRecord& r) {
  auto& tx = WriteTX(t, "insert deploy");
  try {
    tx.Work().exec_prepared("insert_deploy", r.id, r.service_id, std::string(shipyard::model::ToString(r.status)), r.started_at_ms,
                               r.completed_at_ms, r.commit_sha, r.logs_pointer, r.error_message, r.triggered_by);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeployRecord> PgRepository::GetDeploy(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_deploy", id);
  if (res.empty()) return std::nullopt;
  return ReadDeploy(res[0]);
}

std::optional<model::DeployRecord> PgRepository::FindDeployByLogsPointer(Transaction& t, const std::string& logs_pointer) {
  auto res = TX(t).Work().exec_prepared("find_deploy_by_log", logs_pointer);
  if (res.empty()) return std::nullopt;
  return ReadDeploy(res[0]);
}

std::vector<model::DeployRecord> PgRepository::ListDeploys(Transaction& t, const model::DeployFilter& filter) {
  const std::optional<std::string> status =
      filter.status ? std::optional<std::string>(std::string(shipyard::model::ToString(*filter.status))) : std::nullopt;
  const std::optional<int64_t> limit = filter.limit > 0 ? std::optional<int64_t>(static_cast<int64_t>(filter.limit)) : std::nullopt;

  auto res = TX(t).Work().exec_params(
      "SELECT id,service_id,status,started_at_ms,completed_at_ms,commit_sha,logs_pointer,error_message,triggered_by FROM deploys "
      "WHERE ($1::text IS NULL OR status=$1) AND ($2::text IS NULL OR service_id=$2) "
      "ORDER BY started_at_ms DESC, seq DESC LIMIT $3;",
      status, filter.service_id, limit);

  std::vector<model::DeployRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDeploy(row));
  }
  return out;
}

Result PgRepository::MarkRunning(Transaction& t, const std::string& id, const std::string& logs_pointer) {
  auto& tx = WriteTX(t, "mark running");
  try {
    auto res = tx.Work().exec_prepared("mark_running", id, logs_pointer);
    if (res.affected_rows() == 0) return MissOrConflict(tx, id, "pending");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CompleteIfRunning(Transaction& t, const std::string& id, DeployStatus terminal, uint64_t completed_at_ms,
                                       const std::string& error_message) {
  auto& tx = WriteTX(t, "complete deploy");
  try {
    auto res = tx.Work().exec_prepared("complete_if_running", id, std::string(shipyard::model::ToString(terminal)), completed_at_ms,
                                          error_message);
    if (res.affected_rows() == 0) return MissOrConflict(tx, id, "running");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CancelAbandoned(Transaction& t, uint64_t started_before_ms, uint64_t completed_at_ms,
                                     std::vector<std::string>& cancelled_ids) {
  auto& tx = WriteTX(t, "cancel abandoned");
  try {
    auto res = tx.Work().exec_prepared("cancel_abandoned", started_before_ms, completed_at_ms);
    for (const auto& row : res) {
      cancelled_ids.emplace_back(row[0].c_str());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  auto& tx = WriteTX(t, "insert audit");
  try {
    tx.Work().exec_prepared("insert_audit", r.id, r.at_ms, r.actor, r.action, r.entity_type, r.entity_id,
                               std::string(model::ToString(r.outcome)), r.detail);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::ListAudit(Transaction& t, std::size_t limit) {
  const std::optional<int64_t> bound = limit > 0 ? std::optional<int64_t>(static_cast<int64_t>(limit)) : std::nullopt;
  auto res = TX(t).Work().exec_params(
      "SELECT id,at_ms,actor,action,entity_type,entity_id,outcome,detail FROM audit_log ORDER BY seq DESC LIMIT $1;", bound);

  std::vector<model::AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AuditRecord r;
    r.id          = row[0].c_str();
    r.at_ms       = row[1].as<uint64_t>();
    r.actor       = row[2].c_str();
    r.action      = row[3].c_str();
    r.entity_type = row[4].c_str();
    r.entity_id   = row[5].c_str();
    r.outcome     = ParseOutcome(row[6].c_str());
    r.detail      = row[7].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace shipyard::db::postgres
