#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>

namespace baton::db::sqlite {

namespace v1 = baton::coordination::v1;

using baton::db::ErrorCode;
using baton::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static uint32_t ColU32(sqlite3_stmt* st, int col) {
    return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static sqlite3_stmt* PrepareOrNull(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return nullptr;
    return st;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
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

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

static model::SessionRecord ReadSession(sqlite3_stmt* st) {
    model::SessionRecord r;
    r.session_id = ColText(st, 0);
    r.status = static_cast<v1::SessionStatus>(ColI32(st, 1));
    r.mode = static_cast<v1::ExecutionMode>(ColI32(st, 2));
    r.scope_json = ColText(st, 3);
    r.created_at_ms = ColU64(st, 4);
    r.closed_at_ms = ColU64(st, 5);
    return r;
}

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO sessions(session_id,status,mode,scope_json,created_at_ms,closed_at_ms) "
        "VALUES(?,?,?,?,?,?) ON CONFLICT(session_id) DO NOTHING;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.session_id);
    BindI32(st, 2, static_cast<int>(r.status));
    BindI32(st, 3, static_cast<int>(r.mode));
    BindText(st, 4, r.scope_json);
    BindU64(st, 5, r.created_at_ms);
    BindU64(st, 6, r.closed_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::AlreadyExists, "session exists");
    return Translate(db, rc);
}

std::optional<model::SessionRecord>
SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT session_id,status,mode,scope_json,created_at_ms,closed_at_ms "
        "FROM sessions WHERE session_id=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return std::nullopt;

    BindText(st, 1, session_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadSession(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t, uint32_t limit) {
    auto* db = TX(t).Handle();
    std::vector<model::SessionRecord> out;

    const char* sql =
        "SELECT session_id,status,mode,scope_json,created_at_ms,closed_at_ms "
        "FROM sessions ORDER BY created_at_ms, session_id LIMIT ?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return out;

    // LIMIT -1 means unbounded in sqlite
    sqlite3_bind_int64(st, 1, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadSession(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE sessions SET status=?,mode=?,scope_json=?,closed_at_ms=? WHERE session_id=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    BindI32(st, 2, static_cast<int>(r.mode));
    BindText(st, 3, r.scope_json);
    BindU64(st, 4, r.closed_at_ms);
    BindText(st, 5, r.session_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "session not found");
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Task groups
// ------------------------------------------------------------------

static constexpr const char* kTaskGroupColumns =
    "session_id,group_id,name,status,assigned_role,implementer_role,review_iteration,"
    "no_progress_count,blocking_issues_count,complexity,updated_at_ms,attempts";

static model::TaskGroupRecord ReadTaskGroup(sqlite3_stmt* st) {
    model::TaskGroupRecord r;
    r.session_id = ColText(st, 0);
    r.group_id = ColText(st, 1);
    r.name = ColText(st, 2);
    r.status = static_cast<v1::GroupStatus>(ColI32(st, 3));
    r.assigned_role = static_cast<v1::Role>(ColI32(st, 4));
    r.implementer_role = static_cast<v1::Role>(ColI32(st, 5));
    r.review_iteration = ColU32(st, 6);
    r.no_progress_count = ColU32(st, 7);
    r.blocking_issues_count = ColU32(st, 8);
    r.complexity = ColU32(st, 9);
    r.updated_at_ms = ColU64(st, 10);
    r.attempts = ColU32(st, 11);
    return r;
}

Result SqliteRepository::UpsertTaskGroup(Transaction& t, const model::TaskGroupRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("INSERT INTO task_groups(") + kTaskGroupColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(session_id,group_id) DO UPDATE SET name=excluded.name, status=excluded.status, "
        "assigned_role=excluded.assigned_role, implementer_role=excluded.implementer_role, "
        "review_iteration=excluded.review_iteration, no_progress_count=excluded.no_progress_count, "
        "blocking_issues_count=excluded.blocking_issues_count, complexity=excluded.complexity, "
        "updated_at_ms=excluded.updated_at_ms, attempts=excluded.attempts;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.session_id);
    BindText(st, 2, r.group_id);
    BindText(st, 3, r.name);
    BindI32(st, 4, static_cast<int>(r.status));
    BindI32(st, 5, static_cast<int>(r.assigned_role));
    BindI32(st, 6, static_cast<int>(r.implementer_role));
    BindU64(st, 7, r.review_iteration);
    BindU64(st, 8, r.no_progress_count);
    BindU64(st, 9, r.blocking_issues_count);
    BindU64(st, 10, r.complexity);
    BindU64(st, 11, r.updated_at_ms);
    BindU64(st, 12, r.attempts);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::TaskGroupRecord>
SqliteRepository::GetTaskGroup(Transaction& t, const std::string& session_id, const std::string& group_id) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("SELECT ") + kTaskGroupColumns + " FROM task_groups WHERE session_id=? AND group_id=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st, 1, session_id);
    BindText(st, 2, group_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadTaskGroup(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::TaskGroupRecord>
SqliteRepository::ListTaskGroups(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();
    std::vector<model::TaskGroupRecord> out;

    const std::string sql =
        std::string("SELECT ") + kTaskGroupColumns + " FROM task_groups WHERE session_id=? ORDER BY group_id;";

    sqlite3_stmt* st = PrepareOrNull(db, sql.c_str());
    if (!st) return out;

    BindText(st, 1, session_id);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadTaskGroup(st));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

static model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.sequence = ColU64(st, 0);
    r.session_id = ColText(st, 1);
    r.group_id = ColText(st, 2);
    r.event_type = ColText(st, 3);
    r.payload_json = ColText(st, 4);
    r.timestamp_ms = ColU64(st, 5);
    r.dedup_key = ColText(st, 6);
    return r;
}

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO events(session_id,group_id,event_type,payload_json,timestamp_ms,dedup_key) "
        "VALUES(?,?,?,?,?,?) ON CONFLICT(dedup_key) DO NOTHING;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.session_id);
    BindText(st, 2, r.group_id);
    BindText(st, 3, r.event_type);
    BindText(st, 4, r.payload_json);
    BindU64(st, 5, r.timestamp_ms);
    BindText(st, 6, r.dedup_key);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "duplicate dedup key");

    r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::EventRecord>
SqliteRepository::GetEventByDedupKey(Transaction& t, const std::string& dedup_key) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT sequence,session_id,group_id,event_type,payload_json,timestamp_ms,dedup_key "
        "FROM events WHERE dedup_key=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return std::nullopt;

    BindText(st, 1, dedup_key);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEvent(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::EventRecord> SqliteRepository::QueryEvents(Transaction& t, const EventQuery& query) {
    auto* db = TX(t).Handle();
    std::vector<model::EventRecord> out;

    // newest first so LIMIT keeps the latest N; reversed below
    const char* sql =
        "SELECT sequence,session_id,group_id,event_type,payload_json,timestamp_ms,dedup_key "
        "FROM events WHERE session_id=? "
        "AND (?2 IS NULL OR group_id=?2) "
        "AND (?3 IS NULL OR event_type=?3) "
        "AND (?4 IS NULL OR timestamp_ms>=?4) "
        "ORDER BY sequence DESC LIMIT ?5;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return out;

    BindText(st, 1, query.session_id);
    if (query.group_id) BindText(st, 2, *query.group_id);
    else sqlite3_bind_null(st, 2);
    if (query.event_type) BindText(st, 3, *query.event_type);
    else sqlite3_bind_null(st, 3);
    if (query.min_timestamp_ms) BindU64(st, 4, *query.min_timestamp_ms);
    else sqlite3_bind_null(st, 4);
    sqlite3_bind_int64(st, 5, query.limit ? static_cast<sqlite3_int64>(*query.limit) : -1);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadEvent(st));
    }

    sqlite3_finalize(st);
    std::reverse(out.begin(), out.end());
    return out;
}

// ------------------------------------------------------------------
// State snapshots
// ------------------------------------------------------------------

Result SqliteRepository::UpsertState(Transaction& t, const model::StateSnapshotRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO state_snapshots(session_id,scope,state_type,payload_json,updated_at_ms) VALUES(?,?,?,?,?) "
        "ON CONFLICT(session_id,scope,state_type) DO UPDATE SET payload_json=excluded.payload_json, "
        "updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.session_id);
    BindText(st, 2, r.scope);
    BindText(st, 3, r.state_type);
    BindText(st, 4, r.payload_json);
    BindU64(st, 5, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::StateSnapshotRecord>
SqliteRepository::GetState(Transaction& t, const std::string& session_id, const std::string& scope,
                           const std::string& state_type) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT session_id,scope,state_type,payload_json,updated_at_ms FROM state_snapshots "
        "WHERE session_id=? AND scope=? AND state_type=?;";

    sqlite3_stmt* st = PrepareOrNull(db, sql);
    if (!st) return std::nullopt;

    BindText(st, 1, session_id);
    BindText(st, 2, scope);
    BindText(st, 3, state_type);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::StateSnapshotRecord r;
    r.session_id = ColText(st, 0);
    r.scope = ColText(st, 1);
    r.state_type = ColText(st, 2);
    r.payload_json = ColText(st, 3);
    r.updated_at_ms = ColU64(st, 4);

    sqlite3_finalize(st);
    return r;
}

}
