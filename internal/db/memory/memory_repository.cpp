#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace shipyard::db::memory {

using shipyard::model::DeployStatus;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertDeploy(Transaction& t, const model::DeployRecord& r) {
  if (TX(t).View().deploys.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "deploy " + r.id);
  auto& s = TX(t).Mutable(__func__);
  s.deploys[r.id] = r;
  s.deploy_order.push_back(r.id);
  return Result::Ok();
}

std::optional<model::DeployRecord> MemoryRepository::GetDeploy(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.deploys.find(id);
  if (it == s.deploys.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DeployRecord> MemoryRepository::FindDeployByLogsPointer(Transaction& t, const std::string& logs_pointer) {
  const auto& s = TX(t).View();
  for (auto it = s.deploy_order.rbegin(); it != s.deploy_order.rend(); ++it) {
    const auto& record = s.deploys.at(*it);
    if (record.logs_pointer == logs_pointer) return record;
  }
  return std::nullopt;
}

std::vector<model::DeployRecord> MemoryRepository::ListDeploys(Transaction& t, const model::DeployFilter& filter) {
  const auto&                      s = TX(t).View();
  std::vector<model::DeployRecord> out;
  for (auto it = s.deploy_order.rbegin(); it != s.deploy_order.rend(); ++it) {
    if (filter.limit > 0 && out.size() >= filter.limit) break;
    const auto& record = s.deploys.at(*it);
    if (filter.status && record.status != *filter.status) continue;
    if (filter.service_id && record.service_id != filter.service_id) continue;
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::MarkRunning(Transaction& t, const std::string& id, const std::string& logs_pointer) {
  auto it = TX(t).View().deploys.find(id);
  if (it == TX(t).View().deploys.end()) return Result::Err(ErrorCode::NotFound, "deploy " + id);
  if (it->second.status != DeployStatus::kPending) return Result::Err(ErrorCode::Conflict, "deploy " + id + " is not pending");

  auto& record        = TX(t).Mutable(__func__).deploys.at(id);
  record.status       = DeployStatus::kRunning;
  record.logs_pointer = logs_pointer;
  return Result::Ok();
}

Result MemoryRepository::CompleteIfRunning(Transaction& t, const std::string& id, DeployStatus terminal, uint64_t completed_at_ms,
                                           const std::string& error_message) {
  auto it = TX(t).View().deploys.find(id);
  if (it == TX(t).View().deploys.end()) return Result::Err(ErrorCode::NotFound, "deploy " + id);
  if (it->second.status != DeployStatus::kRunning) return Result::Err(ErrorCode::Conflict, "deploy " + id + " is not running");

  auto& record           = TX(t).Mutable(__func__).deploys.at(id);
  record.status          = terminal;
  record.completed_at_ms = completed_at_ms;
  record.error_message   = error_message;
  return Result::Ok();
}

Result MemoryRepository::CancelAbandoned(Transaction& t, uint64_t started_before_ms, uint64_t completed_at_ms,
                                         std::vector<std::string>& cancelled_ids) {
  std::vector<std::string> matched;
  for (const auto& [id, record] : TX(t).View().deploys) {
    const bool open = record.status == DeployStatus::kPending || record.status == DeployStatus::kRunning;
    if (open && record.started_at_ms < started_before_ms) matched.push_back(id);
  }
  if (matched.empty()) return Result::Ok();

  auto& s = TX(t).Mutable(__func__);
  for (const auto& id : matched) {
    auto& record           = s.deploys.at(id);
    record.status          = DeployStatus::kCancelled;
    record.completed_at_ms = completed_at_ms;
    cancelled_ids.push_back(id);
  }
  return Result::Ok();
}

Result MemoryRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  TX(t).Mutable(__func__).audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, std::size_t limit) {
  const auto&                     audit = TX(t).View().audit;
  std::vector<model::AuditRecord> out;
  for (auto it = audit.rbegin(); it != audit.rend(); ++it) {
    if (limit > 0 && out.size() >= limit) break;
    out.push_back(*it);
  }
  return out;
}

} // namespace shipyard::db::memory
