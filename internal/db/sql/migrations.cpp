#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace baton::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  const uint32_t applied = executor.AppliedVersion();
  if (applied > ordered_sql.size()) {
    throw std::runtime_error("database schema version " + std::to_string(applied) + " is newer than this binary supports (" +
                             std::to_string(ordered_sql.size()) + ")");
  }

  for (uint32_t version = applied + 1; version <= ordered_sql.size(); ++version) {
    executor.ExecuteSQL(ordered_sql[version - 1]);
    executor.MarkApplied(version, util::NowMs());
    BATON_LOG_INFO("applied schema migration", {observability::IntField("version", version)});
  }
}

} // namespace baton::db::sql
