#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace baton::db::sqlite {

// BEGIN IMMEDIATE takes the database write lock up front, so a second
// coordinator process on the same file waits (busy_timeout_ms) at Begin
// instead of failing at COMMIT. Holds SqliteDB::TxMutex() while open.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void Finish();

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> tx_lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace baton::db::sqlite
