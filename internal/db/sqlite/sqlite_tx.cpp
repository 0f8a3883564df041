#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace baton::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), tx_lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  std::string error;
  if (!db_->TryExec("ROLLBACK;", &error)) {
    BATON_LOG_WARN("sqlite rollback failed", {observability::StringField("error", error)});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("sqlite transaction already finished");
  }

  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    // A failed COMMIT can leave the transaction open on the connection.
    std::string error;
    if (!db_->TryExec("ROLLBACK;", &error)) {
      BATON_LOG_DEBUG("rollback after failed commit", {observability::StringField("error", error)});
    }
    BATON_LOG_WARN("sqlite commit failed", {observability::StringField("error", e.what())});
    Finish();
    throw;
  }

  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    Finish();
    throw;
  }
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (tx_lock_.owns_lock()) tx_lock_.unlock();
}

} // namespace baton::db::sqlite
