#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "baton/coordination/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace baton::store {

struct SessionOutcome {
  baton::coordination::v1::Session session;
  bool duplicate = false;
};

struct AppendOutcome {
  uint64_t sequence  = 0;
  bool     duplicate = false;
};

struct EventFilter {
  std::string session_id;
  std::optional<std::string> group_id;
  std::optional<std::string> event_type;
  // 0 disables the recency window
  uint64_t within_ms = 0;
  // 0 returns every match
  uint32_t limit = 0;
};

struct StateSnapshot {
  bool        found = false;
  std::string payload_json;
  uint64_t    updated_at_ms = 0;
};

/*
  AtomicUnit

  Every store operation, bound to one open repository transaction.
  Obtained from CoordinationStore::Atomically() or ::Read(); never
  outlives the callback it was handed to.

  Identifiers are validated before any repository call; backend failures
  surface as util::StoreUnavailable, missing parents as util::NotFound.
*/
class AtomicUnit {
 public:
  AtomicUnit(db::Repository& repository, db::Transaction& tx);

  AtomicUnit(const AtomicUnit&)            = delete;
  AtomicUnit& operator=(const AtomicUnit&) = delete;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  // Idempotent: an existing session is returned untouched, flagged duplicate.
  SessionOutcome CreateSession(const std::string& session_id, baton::coordination::v1::ExecutionMode mode,
                               const baton::coordination::v1::ScopeDescriptor& scope);

  std::optional<baton::coordination::v1::Session> GetSession(const std::string& session_id);

  // Throws NotFound.
  baton::coordination::v1::Session RequireSession(const std::string& session_id);

  std::vector<baton::coordination::v1::Session> ListSessions(uint32_t limit);

  void CloseSession(const std::string& session_id, baton::coordination::v1::SessionStatus status, uint64_t closed_at_ms);

  // ---------------------------------------------------------------------
  // Task groups
  // ---------------------------------------------------------------------

  // Creates or replaces the group. review_iteration may never decrease and a
  // status change must follow the group graph (StateInconsistency otherwise).
  baton::coordination::v1::TaskGroup UpsertTaskGroup(const baton::coordination::v1::TaskGroup& group);

  std::optional<baton::coordination::v1::TaskGroup> GetTaskGroup(const std::string& session_id, const std::string& group_id);

  // Throws NotFound.
  baton::coordination::v1::TaskGroup RequireTaskGroup(const std::string& session_id, const std::string& group_id);

  std::vector<baton::coordination::v1::TaskGroup> ListTaskGroups(const std::string& session_id);

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Idempotent on dedup_key. The event_type must name the payload variant.
  AppendOutcome AppendEvent(const std::string& session_id, const std::string& group_id, std::string_view event_type,
                            const baton::coordination::v1::EventPayload& payload, const std::string& dedup_key);

  // Same, with the event_type taken from the payload variant.
  AppendOutcome Append(const std::string& session_id, const std::string& group_id,
                       const baton::coordination::v1::EventPayload& payload, const std::string& dedup_key);

  std::vector<baton::coordination::v1::Event> GetEvents(const EventFilter& filter);

  std::optional<baton::coordination::v1::Event> FindEvent(const std::string& dedup_key);

  // Latest event of one type for a group ("" = session-level), if any.
  std::optional<baton::coordination::v1::Event> LatestEvent(const std::string& session_id, const std::string& group_id,
                                                            std::string_view event_type);

  // ---------------------------------------------------------------------
  // State snapshots
  // ---------------------------------------------------------------------

  void UpsertState(const std::string& session_id, const std::string& scope, const std::string& state_type,
                   const std::string& payload_json);

  StateSnapshot GetState(const std::string& session_id, const std::string& scope, const std::string& state_type);

 private:
  db::Repository&  repository_;
  db::Transaction& tx_;
};

/*
  CoordinationStore

  Owns the repository and the per-session writer locks.

  Atomically(session, fn): one writer per session; fn runs against a
  single transaction which commits when fn returns and rolls back when
  it throws.
*/
class CoordinationStore {
 public:
  explicit CoordinationStore(std::shared_ptr<db::Repository> repository);

  template <typename Fn>
  auto Atomically(const std::string& session_id, Fn&& fn) -> std::invoke_result_t<Fn, AtomicUnit&>;

  // Read-only access; no session lock, still one consistent transaction.
  template <typename Fn>
  auto Read(Fn&& fn) -> std::invoke_result_t<Fn, AtomicUnit&>;

  // ---------------------------------------------------------------------
  // Single-step conveniences
  // ---------------------------------------------------------------------

  SessionOutcome CreateSession(const std::string& session_id, baton::coordination::v1::ExecutionMode mode,
                               const baton::coordination::v1::ScopeDescriptor& scope);
  std::optional<baton::coordination::v1::Session> GetSession(const std::string& session_id);
  std::vector<baton::coordination::v1::Session>   ListSessions(uint32_t limit);

  baton::coordination::v1::TaskGroup                UpsertTaskGroup(const baton::coordination::v1::TaskGroup& group);
  std::optional<baton::coordination::v1::TaskGroup> GetTaskGroup(const std::string& session_id, const std::string& group_id);
  std::vector<baton::coordination::v1::TaskGroup>   ListTaskGroups(const std::string& session_id);

  AppendOutcome AppendEvent(const std::string& session_id, const std::string& group_id, std::string_view event_type,
                            const baton::coordination::v1::EventPayload& payload, const std::string& dedup_key);
  std::vector<baton::coordination::v1::Event> GetEvents(const EventFilter& filter);

  // Rejects reserved state types; those are written through an AtomicUnit only.
  void          UpsertState(const std::string& session_id, const std::string& scope, const std::string& state_type,
                            const std::string& payload_json);
  StateSnapshot GetState(const std::string& session_id, const std::string& scope, const std::string& state_type);

 private:
  std::shared_ptr<std::mutex>      SessionMutex(const std::string& session_id);
  std::unique_ptr<db::Transaction> Begin();
  static void                      Commit(db::Transaction& tx);

  std::shared_ptr<db::Repository> repository_;

  std::mutex                                                   session_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_mutexes_;
};

// Session lock validates the id up front; the lock map never holds garbage keys.
void ValidateSessionIdForLock(const std::string& session_id);

template <typename Fn>
auto CoordinationStore::Atomically(const std::string& session_id, Fn&& fn) -> std::invoke_result_t<Fn, AtomicUnit&> {
  ValidateSessionIdForLock(session_id);

  auto                        session_mutex = SessionMutex(session_id);
  std::lock_guard<std::mutex> session_lock(*session_mutex);

  auto       tx = Begin();
  AtomicUnit unit(*repository_, *tx);

  if constexpr (std::is_void_v<std::invoke_result_t<Fn, AtomicUnit&>>) {
    std::invoke(std::forward<Fn>(fn), unit);
    Commit(*tx);
  } else {
    auto result = std::invoke(std::forward<Fn>(fn), unit);
    Commit(*tx);
    return result;
  }
}

template <typename Fn>
auto CoordinationStore::Read(Fn&& fn) -> std::invoke_result_t<Fn, AtomicUnit&> {
  auto       tx = Begin();
  AtomicUnit unit(*repository_, *tx);

  if constexpr (std::is_void_v<std::invoke_result_t<Fn, AtomicUnit&>>) {
    std::invoke(std::forward<Fn>(fn), unit);
    Commit(*tx);
  } else {
    auto result = std::invoke(std::forward<Fn>(fn), unit);
    Commit(*tx);
    return result;
  }
}

} // namespace baton::store
