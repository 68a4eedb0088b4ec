#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace shipyard::db::sqlite {

using shipyard::db::ErrorCode;
using shipyard::db::Result;
using shipyard::model::DeployStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

static const char* kDeployColumns =
    "id,service_id,status,started_at_ms,completed_at_ms,commit_sha,logs_pointer,error_message,triggered_by";

static model::DeployRecord ReadDeploy(sqlite3_stmt* st) {
    model::DeployRecord r;
    r.id = ColText(st, 0);
    if (!ColIsNull(st, 1)) r.service_id = ColText(st, 1);
    r.status = shipyard::model::ParseDeployStatus(ColText(st, 2)).value_or(DeployStatus::kPending);
    r.started_at_ms = ColU64(st, 3);
    if (!ColIsNull(st, 4)) r.completed_at_ms = ColU64(st, 4);
    r.commit_sha = ColText(st, 5);
    r.logs_pointer = ColText(st, 6);
    r.error_message = ColText(st, 7);
    r.triggered_by = ColText(st, 8);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

SqliteTransaction& SqliteRepository::WriteTX(Transaction& t, const char* op) {
    if (t.Mode() != TxMode::kWrite) throw ReadOnlyTransaction(op);
    return TX(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::MissOrConflict(sqlite3* db, const std::string& id, const char* expected) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT status FROM deploys WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "deploy " + id);
    return Result::Err(ErrorCode::Conflict, "deploy " + id + " is not " + expected);
}

// ------------------------------------------------------------------
// Deploy records
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeploy(Transaction& t, const model::DeployRecord& r) {
    auto* db = WriteTX(t, "insert deploy").Handle();

    const char* sql =
        "INSERT INTO deploys(id,service_id,status,started_at_ms,completed_at_ms,commit_sha,logs_pointer,error_message,triggered_by) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindOptText(st, 2, r.service_id);
    BindText(st, 3, std::string(shipyard::model::ToString(r.status)));
    BindU64(st, 4, r.started_at_ms);
    if (r.completed_at_ms) {
        BindU64(st, 5, *r.completed_at_ms);
    } else {
        sqlite3_bind_null(st, 5);
    }
    BindText(st, 6, r.commit_sha);
    BindText(st, 7, r.logs_pointer);
    BindText(st, 8, r.error_message);
    BindText(st, 9, r.triggered_by);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "deploy " + r.id);
    return Translate(db, rc);
}

std::optional<model::DeployRecord>
SqliteRepository::GetDeploy(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDeployColumns + " FROM deploys WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadDeploy(st);
    sqlite3_finalize(st);
    return r;
}

std::optional<model::DeployRecord>
SqliteRepository::FindDeployByLogsPointer(Transaction& t, const std::string& logs_pointer) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDeployColumns +
                            " FROM deploys WHERE logs_pointer=? ORDER BY started_at_ms DESC, rowid DESC LIMIT 1;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, logs_pointer);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadDeploy(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::DeployRecord>
SqliteRepository::ListDeploys(Transaction& t, const model::DeployFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kDeployColumns + " FROM deploys WHERE 1=1";
    if (filter.status) sql += " AND status=?";
    if (filter.service_id) sql += " AND service_id=?";
    sql += " ORDER BY started_at_ms DESC, rowid DESC";
    if (filter.limit > 0) sql += " LIMIT ?";
    sql += ";";

    std::vector<model::DeployRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    int idx = 1;
    if (filter.status) BindText(st, idx++, std::string(shipyard::model::ToString(*filter.status)));
    if (filter.service_id) BindText(st, idx++, *filter.service_id);
    if (filter.limit > 0) BindU64(st, idx++, filter.limit);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadDeploy(st));
    }
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::MarkRunning(Transaction& t, const std::string& id, const std::string& logs_pointer) {
    auto* db = WriteTX(t, "mark running").Handle();

    const char* sql = "UPDATE deploys SET status='running', logs_pointer=? WHERE id=? AND status='pending';";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, logs_pointer);
    BindText(st, 2, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (auto result = Translate(db, rc); !result) return result;
    if (sqlite3_changes(db) == 0) return MissOrConflict(db, id, "pending");
    return Result::Ok();
}

Result SqliteRepository::CompleteIfRunning(Transaction& t, const std::string& id, DeployStatus terminal,
                                           uint64_t completed_at_ms, const std::string& error_message) {
    auto* db = WriteTX(t, "complete deploy").Handle();

    // compare-and-swap on status; a concurrent checker sees zero changed rows
    const char* sql =
        "UPDATE deploys SET status=?, completed_at_ms=?, error_message=? WHERE id=? AND status='running';";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, std::string(shipyard::model::ToString(terminal)));
    BindU64(st, 2, completed_at_ms);
    BindText(st, 3, error_message);
    BindText(st, 4, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (auto result = Translate(db, rc); !result) return result;
    if (sqlite3_changes(db) == 0) return MissOrConflict(db, id, "running");
    return Result::Ok();
}

Result SqliteRepository::CancelAbandoned(Transaction& t, uint64_t started_before_ms, uint64_t completed_at_ms,
                                         std::vector<std::string>& cancelled_ids) {
    auto* db = WriteTX(t, "cancel abandoned").Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT id FROM deploys WHERE status IN ('pending','running') AND started_at_ms<?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, started_before_ms);
    std::vector<std::string> ids;
    while (sqlite3_step(st) == SQLITE_ROW) {
        ids.push_back(ColText(st, 0));
    }
    sqlite3_finalize(st);

    for (const auto& id : ids) {
        if (sqlite3_prepare_v2(db, "UPDATE deploys SET status='cancelled', completed_at_ms=? WHERE id=? AND status IN ('pending','running');", -1,
                               &st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindU64(st, 1, completed_at_ms);
        BindText(st, 2, id);
        int rc = sqlite3_step(st);
        sqlite3_finalize(st);

        if (auto result = Translate(db, rc); !result) return result;
        if (sqlite3_changes(db) > 0) cancelled_ids.push_back(id);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Audit trail
// ------------------------------------------------------------------

Result SqliteRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
    auto* db = WriteTX(t, "insert audit").Handle();

    const char* sql =
        "INSERT INTO audit_log(id,at_ms,actor,action,entity_type,entity_id,outcome,detail) VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindU64(st, 2, r.at_ms);
    BindText(st, 3, r.actor);
    BindText(st, 4, r.action);
    BindText(st, 5, r.entity_type);
    BindText(st, 6, r.entity_id);
    BindText(st, 7, model::ToString(r.outcome));
    BindText(st, 8, r.detail);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::AuditRecord> SqliteRepository::ListAudit(Transaction& t, std::size_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = "SELECT id,at_ms,actor,action,entity_type,entity_id,outcome,detail FROM audit_log ORDER BY seq DESC";
    if (limit > 0) sql += " LIMIT ?";
    sql += ";";

    std::vector<model::AuditRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;
    if (limit > 0) BindU64(st, 1, limit);

    while (sqlite3_step(st) == SQLITE_ROW) {
        model::AuditRecord r;
        r.id = ColText(st, 0);
        r.at_ms = ColU64(st, 1);
        r.actor = ColText(st, 2);
        r.action = ColText(st, 3);
        r.entity_type = ColText(st, 4);
        r.entity_id = ColText(st, 5);
        const auto outcome = ColText(st, 6);
        r.outcome = outcome == "blocked" ? model::AuditOutcome::kBlocked
                  : outcome == "failed"  ? model::AuditOutcome::kFailed
                                         : model::AuditOutcome::kOk;
        r.detail = ColText(st, 7);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);
    return out;
}

}
