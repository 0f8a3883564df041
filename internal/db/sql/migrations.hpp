#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace baton::db::sql {

// Versioned schema upgrades for SQL backends. A backend supplies statement
// execution and the schema_migrations bookkeeping; RunMigrations decides
// what still needs applying.

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 for a fresh database.
  virtual uint32_t AppliedVersion() = 0;

  virtual void MarkApplied(uint32_t version, uint64_t applied_at_ms) = 0;
};

// Version N is ordered_sql[N - 1]. Versions at or below AppliedVersion()
// are skipped; a database newer than ordered_sql is refused.

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace baton::db::sql
