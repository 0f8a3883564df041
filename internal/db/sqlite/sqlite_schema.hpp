#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace baton::db::sqlite {

// Ordered schema migrations; version N is element N - 1.
const std::vector<std::string>& SchemaMigrations();

// Brings the database up to the latest schema inside one transaction.
void BootstrapSqliteSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace baton::db::sqlite
