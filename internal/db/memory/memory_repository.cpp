#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace baton::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists, "session exists");
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(session_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t, uint32_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.session_id < b.session_id;
  });
  if (limit > 0 && records.size() > limit) records.resize(limit);
  return records;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.session_id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, "session not found");
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Task groups
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTaskGroup(Transaction& t, const model::TaskGroupRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown session");
  s.task_groups[{r.session_id, r.group_id}] = r;
  return Result::Ok();
}

std::optional<model::TaskGroupRecord> MemoryRepository::GetTaskGroup(Transaction& t, const std::string& session_id,
                                                                     const std::string& group_id) {
  const auto& s  = TX(t).View();
  auto        it = s.task_groups.find({session_id, group_id});
  if (it == s.task_groups.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskGroupRecord> MemoryRepository::ListTaskGroups(Transaction& t, const std::string& session_id) {
  const auto&                         s = TX(t).View();
  std::vector<model::TaskGroupRecord> records;
  for (auto it = s.task_groups.lower_bound({session_id, std::string{}}); it != s.task_groups.end() && it->first.first == session_id;
       ++it) {
    records.push_back(it->second);
  }
  return records;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown session");
  if (s.event_by_dedup_key.contains(r.dedup_key)) return Result::Err(ErrorCode::AlreadyExists, "duplicate dedup key");

  r.sequence = s.events.size() + 1;
  s.event_by_dedup_key[r.dedup_key] = s.events.size();
  s.events.push_back(r);
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEventByDedupKey(Transaction& t, const std::string& dedup_key) {
  const auto& s  = TX(t).View();
  auto        it = s.event_by_dedup_key.find(dedup_key);
  if (it == s.event_by_dedup_key.end()) return std::nullopt;
  return s.events[it->second];
}

std::vector<model::EventRecord> MemoryRepository::QueryEvents(Transaction& t, const EventQuery& query) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;

  for (auto it = s.events.rbegin(); it != s.events.rend(); ++it) {
    if (query.limit && out.size() >= *query.limit) break;

    const auto& e = *it;
    if (e.session_id != query.session_id) continue;
    if (query.group_id && e.group_id != *query.group_id) continue;
    if (query.event_type && e.event_type != *query.event_type) continue;
    if (query.min_timestamp_ms && e.timestamp_ms < *query.min_timestamp_ms) continue;
    out.push_back(e);
  }

  std::reverse(out.begin(), out.end());
  return out;
}

// ------------------------------------------------------------------
// State snapshots
// ------------------------------------------------------------------

Result MemoryRepository::UpsertState(Transaction& t, const model::StateSnapshotRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown session");
  s.states[{r.session_id, r.scope, r.state_type}] = r;
  return Result::Ok();
}

std::optional<model::StateSnapshotRecord> MemoryRepository::GetState(Transaction& t, const std::string& session_id,
                                                                     const std::string& scope, const std::string& state_type) {
  const auto& s  = TX(t).View();
  auto        it = s.states.find({session_id, scope, state_type});
  if (it == s.states.end()) return std::nullopt;
  return it->second;
}

} // namespace baton::db::memory
