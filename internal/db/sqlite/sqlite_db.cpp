#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace baton::db::sqlite {

namespace {

bool IsLockContention(int rc) {
  const int primary = rc & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("cannot open " + path_ + ": " + detail);
  }

  sqlite3_extended_result_codes(db_, 1);
  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Fail(int rc, const std::string& what, const std::string& detail) const {
  const std::string message = what + " (" + path_ + "): " + detail;
  if (IsLockContention(rc)) {
    throw util::StoreUnavailable(message);
  }
  throw std::runtime_error(message);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string detail = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  Fail(rc, "sqlite exec", detail);
}

bool SqliteDB::TryExec(const std::string& sql, std::string* error) noexcept {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return true;

  if (error) {
    *error = err ? err : sqlite3_errstr(rc);
  }
  sqlite3_free(err);
  return false;
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    Fail(rc, "sqlite prepare", sqlite3_errmsg(db_));
  }
  return stmt;
}

void SqliteDB::Configure() {
  // WAL lets a second process read the log while the coordinator writes
  if (options_.wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, options_.busy_timeout_ms) != SQLITE_OK) {
    Fail(SQLITE_ERROR, "sqlite busy_timeout", sqlite3_errmsg(db_));
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace baton::db::sqlite
