#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/state_snapshot_record.hpp"
#include "internal/db/model/task_group_record.hpp"

namespace baton::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Event sequences are assigned atomically and never reused
  - A second append with the same dedup key returns AlreadyExists and
    leaves the stored event untouched

  The DB is the source of truth for:
    sessions
    task groups
    the event log
    state snapshots
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  // Oldest first. limit 0 returns every session.
  virtual std::vector<model::SessionRecord> ListSessions(Transaction&, uint32_t limit) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  // ---------------------------------------------------------------------
  // Task groups
  // ---------------------------------------------------------------------

  virtual Result UpsertTaskGroup(Transaction&, const model::TaskGroupRecord&) = 0;

  virtual std::optional<model::TaskGroupRecord> GetTaskGroup(Transaction&, const std::string& session_id, const std::string& group_id) = 0;

  // Ordered by group id.
  virtual std::vector<model::TaskGroupRecord> ListTaskGroups(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Assigns record.sequence on success.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::optional<model::EventRecord> GetEventByDedupKey(Transaction&, const std::string& dedup_key) = 0;

  virtual std::vector<model::EventRecord> QueryEvents(Transaction&, const EventQuery& query) = 0;

  // ---------------------------------------------------------------------
  // State snapshots
  // ---------------------------------------------------------------------

  virtual Result UpsertState(Transaction&, const model::StateSnapshotRecord&) = 0;

  virtual std::optional<model::StateSnapshotRecord> GetState(Transaction&, const std::string& session_id, const std::string& scope,
                                                             const std::string& state_type) = 0;
};

} // namespace baton::db
