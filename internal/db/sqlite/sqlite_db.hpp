#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace baton::db::sqlite {

struct SqliteOptions {
  // false keeps the default rollback journal
  bool wal_mode = true;
  // how long a statement waits on another process's lock before SQLITE_BUSY
  int busy_timeout_ms = 5000;
};

/*
  Owns the single sqlite3 connection of a coordinator process.

  Transactions on it are serialized through TxMutex(); nothing else may
  issue BEGIN on the handle. Lock contention (SQLITE_BUSY / SQLITE_LOCKED)
  surfaces as util::StoreUnavailable so callers can retry, every other
  failure as std::runtime_error.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Pragmas, DDL and transaction control.
  void Exec(const std::string& sql);

  // Same as Exec but reports failure instead of throwing.
  bool TryExec(const std::string& sql, std::string* error = nullptr) noexcept;

  // Caller must sqlite3_finalize.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  void Configure();

  [[noreturn]] void Fail(int rc, const std::string& what, const std::string& detail) const;

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace baton::db::sqlite
