#include "sqlite_schema.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_tx.hpp"

namespace baton::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  uint32_t AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    uint32_t      version = 0;
    int           rc      = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
      version = static_cast<uint32_t>(sqlite3_column_int64(st, 0));
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW) {
      throw std::runtime_error(std::string("read schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
    return version;
  }

  void MarkApplied(uint32_t version, uint64_t applied_at_ms) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
    sqlite3_bind_int64(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(applied_at_ms));
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("record schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: base layout
      "CREATE TABLE sessions ("
      "  session_id TEXT PRIMARY KEY,"
      "  status INTEGER NOT NULL,"
      "  mode INTEGER NOT NULL,"
      "  scope_json TEXT NOT NULL,"
      "  created_at_ms INTEGER NOT NULL,"
      "  closed_at_ms INTEGER NOT NULL DEFAULT 0);"
      "CREATE TABLE task_groups ("
      "  session_id TEXT NOT NULL REFERENCES sessions(session_id),"
      "  group_id TEXT NOT NULL,"
      "  name TEXT NOT NULL,"
      "  status INTEGER NOT NULL,"
      "  assigned_role INTEGER NOT NULL,"
      "  review_iteration INTEGER NOT NULL,"
      "  no_progress_count INTEGER NOT NULL,"
      "  blocking_issues_count INTEGER NOT NULL,"
      "  complexity INTEGER NOT NULL,"
      "  updated_at_ms INTEGER NOT NULL,"
      "  PRIMARY KEY (session_id, group_id));"
      "CREATE TABLE events ("
      "  sequence INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  session_id TEXT NOT NULL REFERENCES sessions(session_id),"
      "  group_id TEXT NOT NULL DEFAULT '',"
      "  event_type TEXT NOT NULL,"
      "  payload_json TEXT NOT NULL,"
      "  timestamp_ms INTEGER NOT NULL,"
      "  dedup_key TEXT NOT NULL UNIQUE);"
      "CREATE INDEX events_by_scope ON events(session_id, group_id, event_type, sequence);"
      "CREATE TABLE state_snapshots ("
      "  session_id TEXT NOT NULL REFERENCES sessions(session_id),"
      "  scope TEXT NOT NULL,"
      "  state_type TEXT NOT NULL,"
      "  payload_json TEXT NOT NULL,"
      "  updated_at_ms INTEGER NOT NULL,"
      "  PRIMARY KEY (session_id, scope, state_type));",

      // 2: escalation tier per group
      "ALTER TABLE task_groups ADD COLUMN implementer_role INTEGER NOT NULL DEFAULT 1;",

      // 3: reviews and missed deadlines per group
      "ALTER TABLE task_groups ADD COLUMN attempts INTEGER NOT NULL DEFAULT 0;",
  };
  return kMigrations;
}

void BootstrapSqliteSchema(const std::shared_ptr<SqliteDB>& db) {
  SqliteTransaction       tx(db);
  SqliteMigrationExecutor executor(*db);
  sql::RunMigrations(executor, SchemaMigrations());
  tx.Commit();
}

} // namespace baton::db::sqlite
