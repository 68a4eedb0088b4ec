#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"

namespace shipyard::db::postgres {

using shipyard::observability::StringField;

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      --live_connections_;
      SHIPYARD_LOG_WARN("dropping closed postgres connection");
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();
      return Connect();
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

std::shared_ptr<pqxx::connection> PgPool::Connect() {
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    SHIPYARD_LOG_ERROR("postgres connect failed", {StringField("error", e.what())});
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_deploy",
               "SELECT id,service_id,status,started_at_ms,completed_at_ms,commit_sha,logs_pointer,error_message,triggered_by "
               "FROM deploys WHERE id=$1");

  conn.prepare("find_deploy_by_log",
               "SELECT id,service_id,status,started_at_ms,completed_at_ms,commit_sha,logs_pointer,error_message,triggered_by "
               "FROM deploys WHERE logs_pointer=$1 ORDER BY started_at_ms DESC, seq DESC LIMIT 1");

  conn.prepare("insert_deploy",
               "INSERT INTO deploys(id,service_id,status,started_at_ms,completed_at_ms,commit_sha,logs_pointer,error_message,triggered_by) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("mark_running", "UPDATE deploys SET status='running', logs_pointer=$2 WHERE id=$1 AND status='pending'");

  conn.prepare("complete_if_running",
               "UPDATE deploys SET status=$2, completed_at_ms=$3, error_message=$4 WHERE id=$1 AND status='running'");

  conn.prepare("cancel_abandoned",
               "UPDATE deploys SET status='cancelled', completed_at_ms=$2 "
               "WHERE status IN ('pending','running') AND started_at_ms<$1 RETURNING id");

  conn.prepare("deploy_status", "SELECT status FROM deploys WHERE id=$1");

  conn.prepare("insert_audit",
               "INSERT INTO audit_log(id,at_ms,actor,action,entity_type,entity_id,outcome,detail) VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace shipyard::db::postgres
