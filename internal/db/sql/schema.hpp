#pragma once

#include <string>
#include <vector>

namespace shipyard::db::sql {

/*
  Bootstrap DDL, applied at start-up. Statements are idempotent.

  status is stored as text (pending, running, ...) in both backends.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS deploys (id TEXT PRIMARY KEY, service_id TEXT, status TEXT NOT NULL, started_at_ms INTEGER NOT NULL, "
      "completed_at_ms INTEGER, commit_sha TEXT NOT NULL DEFAULT '', logs_pointer TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL DEFAULT '', "
      "triggered_by TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS deploys_status_idx ON deploys(status);",
      "CREATE INDEX IF NOT EXISTS deploys_logs_pointer_idx ON deploys(logs_pointer);",
      "CREATE TABLE IF NOT EXISTS audit_log (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, at_ms INTEGER NOT NULL, actor TEXT NOT NULL, "
      "action TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, outcome TEXT NOT NULL, detail TEXT NOT NULL DEFAULT '');"};
  return kSql;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS deploys (id TEXT PRIMARY KEY, service_id TEXT, status TEXT NOT NULL, started_at_ms BIGINT NOT NULL, "
      "completed_at_ms BIGINT, commit_sha TEXT NOT NULL DEFAULT '', logs_pointer TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL DEFAULT '', "
      "triggered_by TEXT NOT NULL DEFAULT '', seq BIGSERIAL);",
      "CREATE INDEX IF NOT EXISTS deploys_status_idx ON deploys(status);",
      "CREATE INDEX IF NOT EXISTS deploys_logs_pointer_idx ON deploys(logs_pointer);",
      "CREATE TABLE IF NOT EXISTS audit_log (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, at_ms BIGINT NOT NULL, actor TEXT NOT NULL, "
      "action TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, outcome TEXT NOT NULL, detail TEXT NOT NULL DEFAULT '');"};
  return kSql;
}

} // namespace shipyard::db::sql
