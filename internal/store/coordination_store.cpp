#include "coordination_store.hpp"

#include <set>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/event_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifiers.hpp"
#include "internal/util/time.hpp"

namespace baton::store {

namespace v1 = baton::coordination::v1;

namespace {

void ThrowIfError(const db::Result& result, const std::string& what) {
  if (result) return;

  const std::string message = what + ": " + std::string(db::ErrorCodeName(result.code)) + ": " + result.message;
  if (result.Retryable()) {
    throw util::StoreUnavailable(message);
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::ConflictError(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::StateInconsistency(message);
    default:
      throw std::runtime_error(message);
  }
}

v1::Session ToProto(const db::model::SessionRecord& r) {
  v1::Session session;
  session.set_session_id(r.session_id);
  session.set_status(r.status);
  session.set_mode(r.mode);
  if (!r.scope_json.empty()) {
    FromJson(r.scope_json, session.mutable_original_scope());
  }
  session.set_created_at_ms(r.created_at_ms);
  session.set_closed_at_ms(r.closed_at_ms);
  return session;
}

v1::TaskGroup ToProto(const db::model::TaskGroupRecord& r) {
  v1::TaskGroup group;
  group.set_session_id(r.session_id);
  group.set_group_id(r.group_id);
  group.set_name(r.name);
  group.set_status(r.status);
  group.set_assigned_role(r.assigned_role);
  group.set_implementer_role(r.implementer_role);
  group.set_review_iteration(r.review_iteration);
  group.set_no_progress_count(r.no_progress_count);
  group.set_blocking_issues_count(r.blocking_issues_count);
  group.set_complexity(r.complexity);
  group.set_updated_at_ms(r.updated_at_ms);
  group.set_attempts(r.attempts);
  return group;
}

db::model::TaskGroupRecord ToRecord(const v1::TaskGroup& g) {
  db::model::TaskGroupRecord r;
  r.session_id            = g.session_id();
  r.group_id              = g.group_id();
  r.name                  = g.name();
  r.status                = g.status();
  r.assigned_role         = g.assigned_role();
  r.implementer_role      = g.implementer_role();
  r.review_iteration      = g.review_iteration();
  r.no_progress_count     = g.no_progress_count();
  r.blocking_issues_count = g.blocking_issues_count();
  r.complexity            = g.complexity();
  r.updated_at_ms         = g.updated_at_ms();
  r.attempts              = g.attempts();
  return r;
}

v1::Event ToProto(const db::model::EventRecord& r) {
  v1::Event event;
  event.set_sequence(r.sequence);
  event.set_session_id(r.session_id);
  event.set_group_id(r.group_id);
  event.set_event_type(r.event_type);
  *event.mutable_payload() = DecodePayload(r.payload_json);
  event.set_timestamp_ms(r.timestamp_ms);
  event.set_dedup_key(r.dedup_key);
  return event;
}

void ValidatePayloadContents(const v1::EventPayload& payload) {
  if (payload.has_issues_raised()) {
    for (const auto& issue : payload.issues_raised().issues()) {
      util::ValidateIssueId(issue.issue_id());
    }
  }
  if (payload.has_issue_responses()) {
    for (const auto& response : payload.issue_responses().responses()) {
      util::ValidateIssueId(response.issue_id());
    }
  }
}

} // namespace

void ValidateSessionIdForLock(const std::string& session_id) {
  util::ValidateSessionId(session_id);
}

// ------------------------------------------------------------------
// AtomicUnit
// ------------------------------------------------------------------

AtomicUnit::AtomicUnit(db::Repository& repository, db::Transaction& tx) : repository_(repository), tx_(tx) {
}

SessionOutcome AtomicUnit::CreateSession(const std::string& session_id, v1::ExecutionMode mode, const v1::ScopeDescriptor& scope) {
  util::ValidateSessionId(session_id);
  if (mode == v1::EXECUTION_MODE_UNSPECIFIED) {
    mode = v1::EXECUTION_MODE_SINGLE_TRACK;
  }
  std::set<std::string> item_ids;
  for (const auto& item : scope.items()) {
    // Scope item ids end up inside derived dedup keys; they follow the group id rules.
    if (!util::IsValidGroupId(item.item_id())) {
      throw util::ValidationError("invalid scope item id: " + item.item_id());
    }
    if (!item_ids.insert(item.item_id()).second) {
      throw util::ValidationError("scope item listed twice: " + item.item_id());
    }
  }

  if (auto existing = repository_.GetSession(tx_, session_id)) {
    return {ToProto(*existing), true};
  }

  db::model::SessionRecord record;
  record.session_id    = session_id;
  record.status        = v1::SESSION_STATUS_ACTIVE;
  record.mode          = mode;
  record.scope_json    = ToJson(scope);
  record.created_at_ms = util::NowMs();

  ThrowIfError(repository_.InsertSession(tx_, record), "create session " + session_id);
  return {ToProto(record), false};
}

std::optional<v1::Session> AtomicUnit::GetSession(const std::string& session_id) {
  util::ValidateSessionId(session_id);
  auto record = repository_.GetSession(tx_, session_id);
  if (!record) return std::nullopt;
  return ToProto(*record);
}

v1::Session AtomicUnit::RequireSession(const std::string& session_id) {
  auto session = GetSession(session_id);
  if (!session) {
    throw util::NotFound("session not found: " + session_id);
  }
  return *session;
}

std::vector<v1::Session> AtomicUnit::ListSessions(uint32_t limit) {
  std::vector<v1::Session> out;
  for (const auto& record : repository_.ListSessions(tx_, limit)) {
    out.push_back(ToProto(record));
  }
  return out;
}

void AtomicUnit::CloseSession(const std::string& session_id, v1::SessionStatus status, uint64_t closed_at_ms) {
  util::ValidateSessionId(session_id);
  auto record = repository_.GetSession(tx_, session_id);
  if (!record) {
    throw util::NotFound("session not found: " + session_id);
  }
  record->status       = status;
  record->closed_at_ms = closed_at_ms;
  ThrowIfError(repository_.UpdateSession(tx_, *record), "close session " + session_id);
}

v1::TaskGroup AtomicUnit::UpsertTaskGroup(const v1::TaskGroup& group) {
  util::ValidateSessionId(group.session_id());
  util::ValidateGroupId(group.group_id());
  RequireSession(group.session_id());

  v1::TaskGroup next = group;
  auto          existing = repository_.GetTaskGroup(tx_, group.session_id(), group.group_id());

  if (existing) {
    if (next.review_iteration() < existing->review_iteration) {
      throw util::ValidationError("review_iteration of " + group.group_id() + " may not decrease (" +
                                  std::to_string(existing->review_iteration) + " -> " + std::to_string(next.review_iteration()) + ")");
    }
    if (next.status() == v1::GROUP_STATUS_UNSPECIFIED) next.set_status(existing->status);
    if (next.implementer_role() == v1::ROLE_UNSPECIFIED) next.set_implementer_role(existing->implementer_role);
    if (next.name().empty()) next.set_name(existing->name);
    if (next.attempts() < existing->attempts) next.set_attempts(existing->attempts);
  } else {
    if (next.status() == v1::GROUP_STATUS_UNSPECIFIED) next.set_status(v1::GROUP_STATUS_PENDING);
    if (next.implementer_role() == v1::ROLE_UNSPECIFIED) next.set_implementer_role(v1::ROLE_IMPLEMENTER);
  }

  // Review verdicts land straight from ReadyForReview, so the store accepts the review shortcut.
  const auto from = existing ? existing->status : v1::GROUP_STATUS_PENDING;
  if (!model::CanTransitionViaReview(from, next.status())) {
    throw util::StateInconsistency("group " + group.group_id() + " cannot move from " + v1::GroupStatus_Name(from) + " to " +
                                   v1::GroupStatus_Name(next.status()));
  }
  next.set_updated_at_ms(util::NowMs());

  ThrowIfError(repository_.UpsertTaskGroup(tx_, ToRecord(next)), "upsert task group " + group.group_id());
  return next;
}

std::optional<v1::TaskGroup> AtomicUnit::GetTaskGroup(const std::string& session_id, const std::string& group_id) {
  util::ValidateSessionId(session_id);
  util::ValidateGroupId(group_id);
  auto record = repository_.GetTaskGroup(tx_, session_id, group_id);
  if (!record) return std::nullopt;
  return ToProto(*record);
}

v1::TaskGroup AtomicUnit::RequireTaskGroup(const std::string& session_id, const std::string& group_id) {
  auto group = GetTaskGroup(session_id, group_id);
  if (!group) {
    throw util::NotFound("task group not found: " + session_id + "/" + group_id);
  }
  return *group;
}

std::vector<v1::TaskGroup> AtomicUnit::ListTaskGroups(const std::string& session_id) {
  util::ValidateSessionId(session_id);
  std::vector<v1::TaskGroup> out;
  for (const auto& record : repository_.ListTaskGroups(tx_, session_id)) {
    out.push_back(ToProto(record));
  }
  return out;
}

AppendOutcome AtomicUnit::AppendEvent(const std::string& session_id, const std::string& group_id, std::string_view event_type,
                                      const v1::EventPayload& payload, const std::string& dedup_key) {
  util::ValidateSessionId(session_id);
  if (!group_id.empty()) util::ValidateGroupId(group_id);
  util::ValidateDedupKey(dedup_key);
  CheckDiscriminator(event_type, payload);
  ValidatePayloadContents(payload);
  RequireSession(session_id);

  if (auto existing = repository_.GetEventByDedupKey(tx_, dedup_key)) {
    if (existing->session_id != session_id || existing->group_id != group_id || existing->event_type != event_type) {
      throw util::DedupKeyReused("dedup key " + dedup_key + " already bound to a different event");
    }
    return {existing->sequence, true};
  }

  db::model::EventRecord record;
  record.session_id   = session_id;
  record.group_id     = group_id;
  record.event_type   = std::string(event_type);
  record.payload_json = EncodePayload(payload);
  record.timestamp_ms = util::NowMs();
  record.dedup_key    = dedup_key;

  ThrowIfError(repository_.AppendEvent(tx_, record), "append " + record.event_type);
  return {record.sequence, false};
}

AppendOutcome AtomicUnit::Append(const std::string& session_id, const std::string& group_id, const v1::EventPayload& payload,
                                 const std::string& dedup_key) {
  return AppendEvent(session_id, group_id, EventTypeFor(payload.kind_case()), payload, dedup_key);
}

std::vector<v1::Event> AtomicUnit::GetEvents(const EventFilter& filter) {
  util::ValidateSessionId(filter.session_id);
  if (filter.group_id && !filter.group_id->empty()) util::ValidateGroupId(*filter.group_id);
  if (filter.event_type && PayloadCaseFor(*filter.event_type) == v1::EventPayload::KIND_NOT_SET) {
    throw util::ValidationError("unknown event type: " + *filter.event_type);
  }

  db::EventQuery query;
  query.session_id = filter.session_id;
  query.group_id   = filter.group_id;
  query.event_type = filter.event_type;
  if (filter.within_ms > 0) {
    query.min_timestamp_ms = util::WindowStartMs(util::NowMs(), filter.within_ms);
  }
  if (filter.limit > 0) query.limit = filter.limit;

  std::vector<v1::Event> out;
  for (const auto& record : repository_.QueryEvents(tx_, query)) {
    out.push_back(ToProto(record));
  }
  return out;
}

std::optional<v1::Event> AtomicUnit::FindEvent(const std::string& dedup_key) {
  util::ValidateDedupKey(dedup_key);
  auto record = repository_.GetEventByDedupKey(tx_, dedup_key);
  if (!record) return std::nullopt;
  return ToProto(*record);
}

std::optional<v1::Event> AtomicUnit::LatestEvent(const std::string& session_id, const std::string& group_id,
                                                 std::string_view event_type) {
  EventFilter filter;
  filter.session_id = session_id;
  filter.group_id   = group_id;
  filter.event_type = std::string(event_type);
  filter.limit      = 1;

  auto events = GetEvents(filter);
  if (events.empty()) return std::nullopt;
  return events.back();
}

void AtomicUnit::UpsertState(const std::string& session_id, const std::string& scope, const std::string& state_type,
                             const std::string& payload_json) {
  util::ValidateSessionId(session_id);
  util::ValidateScope(scope);
  util::ValidateStateType(state_type);
  if (!IsValidJson(payload_json)) {
    throw util::ValidationError("state payload for " + scope + "/" + state_type + " is not valid JSON");
  }
  RequireSession(session_id);

  db::model::StateSnapshotRecord record;
  record.session_id    = session_id;
  record.scope         = scope;
  record.state_type    = state_type;
  record.payload_json  = payload_json;
  record.updated_at_ms = util::NowMs();

  ThrowIfError(repository_.UpsertState(tx_, record), "upsert state " + scope + "/" + state_type);
}

StateSnapshot AtomicUnit::GetState(const std::string& session_id, const std::string& scope, const std::string& state_type) {
  util::ValidateSessionId(session_id);
  util::ValidateScope(scope);
  util::ValidateStateType(state_type);

  StateSnapshot snapshot;
  auto          record = repository_.GetState(tx_, session_id, scope, state_type);
  if (!record) return snapshot;

  snapshot.found         = true;
  snapshot.payload_json  = record->payload_json;
  snapshot.updated_at_ms = record->updated_at_ms;
  return snapshot;
}

// ------------------------------------------------------------------
// CoordinationStore
// ------------------------------------------------------------------

CoordinationStore::CoordinationStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("coordination store requires a repository");
  }
}

std::shared_ptr<std::mutex> CoordinationStore::SessionMutex(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(session_mutexes_guard_);
  auto&                       session_mutex = session_mutexes_[session_id];
  if (!session_mutex) {
    session_mutex = std::make_shared<std::mutex>();
  }
  return session_mutex;
}

std::unique_ptr<db::Transaction> CoordinationStore::Begin() {
  try {
    return repository_->Begin();
  } catch (const std::runtime_error& e) {
    BATON_LOG_WARN("store begin failed", {observability::StringField("error", e.what())});
    throw util::StoreUnavailable(std::string("begin transaction: ") + e.what());
  }
}

void CoordinationStore::Commit(db::Transaction& tx) {
  try {
    tx.Commit();
  } catch (const std::runtime_error& e) {
    BATON_LOG_WARN("store commit failed", {observability::StringField("error", e.what())});
    throw util::StoreUnavailable(std::string("commit transaction: ") + e.what());
  }
}

SessionOutcome CoordinationStore::CreateSession(const std::string& session_id, v1::ExecutionMode mode, const v1::ScopeDescriptor& scope) {
  return Atomically(session_id, [&](AtomicUnit& unit) { return unit.CreateSession(session_id, mode, scope); });
}

std::optional<v1::Session> CoordinationStore::GetSession(const std::string& session_id) {
  return Read([&](AtomicUnit& unit) { return unit.GetSession(session_id); });
}

std::vector<v1::Session> CoordinationStore::ListSessions(uint32_t limit) {
  return Read([&](AtomicUnit& unit) { return unit.ListSessions(limit); });
}

v1::TaskGroup CoordinationStore::UpsertTaskGroup(const v1::TaskGroup& group) {
  return Atomically(group.session_id(), [&](AtomicUnit& unit) { return unit.UpsertTaskGroup(group); });
}

std::optional<v1::TaskGroup> CoordinationStore::GetTaskGroup(const std::string& session_id, const std::string& group_id) {
  return Read([&](AtomicUnit& unit) { return unit.GetTaskGroup(session_id, group_id); });
}

std::vector<v1::TaskGroup> CoordinationStore::ListTaskGroups(const std::string& session_id) {
  return Read([&](AtomicUnit& unit) { return unit.ListTaskGroups(session_id); });
}

AppendOutcome CoordinationStore::AppendEvent(const std::string& session_id, const std::string& group_id, std::string_view event_type,
                                             const v1::EventPayload& payload, const std::string& dedup_key) {
  return Atomically(session_id,
                    [&](AtomicUnit& unit) { return unit.AppendEvent(session_id, group_id, event_type, payload, dedup_key); });
}

std::vector<v1::Event> CoordinationStore::GetEvents(const EventFilter& filter) {
  return Read([&](AtomicUnit& unit) { return unit.GetEvents(filter); });
}

void CoordinationStore::UpsertState(const std::string& session_id, const std::string& scope, const std::string& state_type,
                                    const std::string& payload_json) {
  if (util::IsReservedStateType(state_type)) {
    throw util::ValidationError("state type " + state_type + " is reserved for the coordinator");
  }
  Atomically(session_id, [&](AtomicUnit& unit) { unit.UpsertState(session_id, scope, state_type, payload_json); });
}

StateSnapshot CoordinationStore::GetState(const std::string& session_id, const std::string& scope, const std::string& state_type) {
  return Read([&](AtomicUnit& unit) { return unit.GetState(session_id, scope, state_type); });
}

} // namespace baton::store
