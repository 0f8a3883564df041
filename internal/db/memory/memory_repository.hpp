#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace baton::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SessionRecord> sessions;
    std::map<std::pair<std::string, std::string>, model::TaskGroupRecord> task_groups;

    // Append order; sequence == index + 1.
    std::vector<model::EventRecord> events;
    std::unordered_map<std::string, std::size_t> event_by_dedup_key;

    std::map<std::tuple<std::string, std::string, std::string>, model::StateSnapshotRecord> states;
  };

  // Held by the open transaction for its whole lifetime.
  std::mutex tx_mutex_;

  std::mutex mutex_;
  State committed_;
};

}
