#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace baton::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&, uint32_t limit) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&) override;

  Result UpsertTaskGroup(Transaction&, const model::TaskGroupRecord&) override;
  std::optional<model::TaskGroupRecord> GetTaskGroup(Transaction&, const std::string& session_id,
                                                     const std::string& group_id) override;
  std::vector<model::TaskGroupRecord> ListTaskGroups(Transaction&, const std::string& session_id) override;

  Result AppendEvent(Transaction&, model::EventRecord& record) override;
  std::optional<model::EventRecord> GetEventByDedupKey(Transaction&, const std::string& dedup_key) override;
  std::vector<model::EventRecord> QueryEvents(Transaction&, const EventQuery& query) override;

  Result UpsertState(Transaction&, const model::StateSnapshotRecord&) override;
  std::optional<model::StateSnapshotRecord> GetState(Transaction&, const std::string& session_id,
                                                     const std::string& scope,
                                                     const std::string& state_type) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
