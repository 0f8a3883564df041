#include "coordinator.hpp"

#include <set>
#include <string_view>
#include <vector>

#include "internal/ledger/issue_ledger.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/store/event_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifiers.hpp"
#include "internal/util/time.hpp"
#include "internal/validation/validator_gate.hpp"

namespace baton::core {

namespace v1 = baton::coordination::v1;

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kTimeoutStatus    = "TIMEOUT";
constexpr std::string_view kEscalationStatus = "ESCALATION_REQUESTED";
constexpr std::string_view kResponsesStatus  = "RESPONSES";
constexpr std::string_view kRejectionsStatus = "REJECTION_REVIEW";
constexpr std::string_view kReviewStatus     = "REVIEW";

// Groups past planning that are neither signed off nor rejected.
bool InFlight(v1::GroupStatus status) {
  return status != v1::GROUP_STATUS_UNSPECIFIED && status != v1::GROUP_STATUS_PENDING && status != v1::GROUP_STATUS_REJECTED &&
         !model::IsSignedOff(status);
}

// Caller key when given; otherwise one derived from the session's event sequence.
std::string DedupBase(store::AtomicUnit& unit, const std::string& session_id, std::string_view op, const std::string& requested) {
  if (!requested.empty()) {
    util::ValidateDedupKey(requested);
    return requested;
  }

  store::EventFilter filter;
  filter.session_id = session_id;
  filter.limit      = 1;
  const auto     last = unit.GetEvents(filter);
  const uint64_t next = last.empty() ? 1 : last.back().sequence() + 1;
  return session_id + ":" + std::string(op) + ":" + std::to_string(next);
}

// Stored event under key, provided it belongs to the same call shape.
std::optional<v1::Event> Replayed(store::AtomicUnit& unit, const std::string& key, const std::string& session_id,
                                  const std::string& group_id, std::string_view event_type) {
  auto event = unit.FindEvent(key);
  if (!event) return std::nullopt;
  if (event->session_id() != session_id || event->group_id() != group_id || event->event_type() != event_type) {
    throw util::DedupKeyReused("dedup key " + key + " already used for a different call");
  }
  BATON_LOG_DEBUG("replaying recorded outcome", {StringField("session_id", session_id), StringField("dedup_key", key),
                                                  IntField("sequence", static_cast<int64_t>(event->sequence()))});
  return event;
}

template <typename Response>
void MarkReplay(Response& response, const std::string& message = "replayed") {
  response.mutable_result()->set_tag(v1::RESULT_TAG_CONFLICT);
  response.mutable_result()->set_message(message);
}

v1::EventPayload Audit(const std::string& category, const std::string& message) {
  v1::EventPayload payload;
  payload.mutable_audit()->set_category(category);
  payload.mutable_audit()->set_message(message);
  return payload;
}

void RequireRole(v1::Role role) {
  if (role == v1::ROLE_UNSPECIFIED) {
    throw util::ValidationError("role must be specified");
  }
}

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& values) {
  return {values.begin(), values.end()};
}

} // namespace

Coordinator::Coordinator(std::shared_ptr<store::CoordinationStore> store, std::shared_ptr<workflow::SessionConfigCache> configs)
    : store_(std::move(store)), configs_(std::move(configs)) {
  if (!store_ || !configs_) {
    throw std::invalid_argument("coordinator requires a store and a workflow cache");
  }
}

// ------------------------------------------------------------------
// Shared steps
// ------------------------------------------------------------------

std::optional<v1::RoutingDecision> Coordinator::DropIfStale(store::AtomicUnit& unit, const v1::TaskGroup& group, v1::Role role,
                                                            const std::string& status_code, const std::string& dedup_base,
                                                            bool* duplicate) {
  const auto status = group.status();
  const bool stale  = model::IsTerminal(status) || (status == v1::GROUP_STATUS_ESCALATED && role != group.assigned_role());
  if (!stale) return std::nullopt;

  const std::string reason = "stale report from " + v1::Role_Name(role) + ": group is " + v1::GroupStatus_Name(status);
  BATON_LOG_WARN("stale report dropped", {StringField("session_id", group.session_id()), StringField("group_id", group.group_id()),
                                          StringField("role", v1::Role_Name(role)), StringField("status_code", status_code)});

  const auto appended = unit.Append(group.session_id(), group.group_id(), Audit("stale_report", reason),
                                    util::DeriveDedupKey(dedup_base, "stale"));
  if (duplicate) *duplicate = appended.duplicate;

  v1::RoutingDecision decision;
  decision.set_current_role(role);
  decision.set_status_code(status_code);
  decision.set_group_id(group.group_id());
  decision.set_group_status(status);
  decision.set_stale(true);
  decision.set_reason(reason);
  return decision;
}

workflow::TransitionOutcome Coordinator::FailClosedOnInconsistency(store::AtomicUnit& unit, const workflow::TransitionEngine& engine,
                                                                   const v1::TaskGroup& group, v1::Role role,
                                                                   const std::string& status_code, const std::string& error,
                                                                   const std::string& dedup_base) {
  BATON_LOG_ERROR("state inconsistency; routing to manager",
                  {StringField("session_id", group.session_id()), StringField("group_id", group.group_id()), StringField("error", error)});
  unit.Append(group.session_id(), group.group_id(), Audit("state_inconsistency", error),
              util::DeriveDedupKey(dedup_base, "inconsistency"));
  return engine.FailClosed(group, role, status_code, error);
}

workflow::TransitionOutcome Coordinator::RouteOrFailClosed(store::AtomicUnit& unit, const workflow::TransitionEngine& engine,
                                                           const workflow::TransitionInput& input, const std::string& dedup_base) {
  try {
    return engine.Route(input);
  } catch (const util::StateInconsistency& e) {
    return FailClosedOnInconsistency(unit, engine, input.group, input.role, input.status_code, e.what(), dedup_base);
  }
}

void Coordinator::Persist(store::AtomicUnit& unit, const workflow::TransitionOutcome& outcome, const std::string& dedup_base) {
  const auto& group    = outcome.group;
  const auto& decision = outcome.decision;

  unit.UpsertTaskGroup(group);

  if (outcome.escalation) {
    BATON_LOG_WARN("group escalated",
                   {StringField("session_id", group.session_id()), StringField("group_id", group.group_id()),
                    StringField("from", v1::Role_Name(outcome.escalation->from_role())),
                    StringField("to", v1::Role_Name(outcome.escalation->to_role())), StringField("reason", outcome.escalation->reason())});
    v1::EventPayload payload;
    *payload.mutable_escalation() = *outcome.escalation;
    unit.Append(group.session_id(), group.group_id(), payload, util::DeriveDedupKey(dedup_base, "escalation"));
    observability::Metrics::Instance().RecordEscalation(v1::Role_Name(outcome.escalation->to_role()));
  }

  if (decision.fail_closed()) {
    BATON_LOG_WARN("routing failed closed", {StringField("session_id", group.session_id()), StringField("group_id", group.group_id()),
                                             StringField("reason", decision.reason())});
  }

  v1::EventPayload payload;
  *payload.mutable_routing_decision() = decision;
  unit.Append(group.session_id(), group.group_id(), payload, util::DeriveDedupKey(dedup_base, "decision"));
  observability::Metrics::Instance().RecordRoutingDecision(v1::TransitionAction_Name(decision.action()), decision.fail_closed());
}

void Coordinator::PlanTracks(store::AtomicUnit& unit, const workflow::TransitionEngine& engine, workflow::TransitionOutcome& outcome,
                             const std::string& dedup_base) {
  if (!outcome.dispatch_pending && !outcome.check_phase) return;

  const auto& group = outcome.group;
  if (unit.RequireSession(group.session_id()).mode() != v1::EXECUTION_MODE_MULTI_TRACK) return;

  std::vector<v1::TaskGroup> pending;
  uint32_t                   in_flight = InFlight(group.status()) ? 1 : 0;
  for (auto& other : unit.ListTaskGroups(group.session_id())) {
    if (other.group_id() == group.group_id()) continue;
    if (other.status() == v1::GROUP_STATUS_PENDING) {
      pending.push_back(std::move(other));
    } else if (InFlight(other.status())) {
      ++in_flight;
    }
  }

  if (outcome.check_phase && pending.empty() && in_flight == 0) {
    outcome.decision.set_phase_complete(true);
    BATON_LOG_INFO("phase complete", {StringField("session_id", group.session_id()), StringField("last_group_id", group.group_id())});
    return;
  }

  const auto* rule = engine.Config().DispatchRule();
  if (!rule) return;

  for (const auto& candidate : pending) {
    if (in_flight >= engine.Config().max_parallel()) break;

    workflow::TransitionInput input;
    input.role               = rule->current_role();
    input.status_code        = rule->status_code();
    input.group              = candidate;
    input.check_capabilities = false;

    workflow::TransitionOutcome dispatched;
    try {
      dispatched = engine.Route(input);
    } catch (const util::StateInconsistency& e) {
      BATON_LOG_WARN("pending group not dispatched", {StringField("session_id", candidate.session_id()),
                                                      StringField("group_id", candidate.group_id()), StringField("error", e.what())});
      continue;
    }
    if (dispatched.decision.fail_closed()) continue;

    Persist(unit, dispatched, util::DeriveDedupKey(dedup_base, "dispatch:" + candidate.group_id()));
    outcome.decision.add_dispatched_group_ids(candidate.group_id());
    ++in_flight;
  }

  if (outcome.decision.dispatched_group_ids_size() > 0) {
    BATON_LOG_INFO("pending groups dispatched", {StringField("session_id", group.session_id()),
                                                 IntField("dispatched", outcome.decision.dispatched_group_ids_size()),
                                                 IntField("in_flight", in_flight)});
  }
}

v1::ValidatorVerdict Coordinator::RunGate(store::AtomicUnit& unit, const v1::Session& session, const std::string& verdict_key) {
  v1::ValidatorVerdict verdict;
  if (session.status() == v1::SESSION_STATUS_COMPLETED) {
    verdict.set_accepted(true);
    return verdict;
  }

  validation::ValidatorGate gate(unit);
  verdict = gate.Evaluate(session);

  v1::EventPayload payload;
  *payload.mutable_validator_verdict() = verdict;
  unit.Append(session.session_id(), "", payload, verdict_key);

  if (verdict.accepted()) {
    unit.CloseSession(session.session_id(), v1::SESSION_STATUS_COMPLETED, util::NowMs());
    configs_->Forget(session.session_id());
    BATON_LOG_INFO("session completed", {StringField("session_id", session.session_id())});
  } else {
    BATON_LOG_WARN("completion rejected",
                   {StringField("session_id", session.session_id()), IntField("missing", verdict.missing_size())});
  }
  return verdict;
}

// ------------------------------------------------------------------
// Store surface
// ------------------------------------------------------------------

v1::CreateSessionResponse Coordinator::CreateSession(const v1::CreateSessionRequest& request) {
  return store_->Atomically(request.session_id(), [&](store::AtomicUnit& unit) {
    v1::CreateSessionResponse response;
    auto outcome = unit.CreateSession(request.session_id(), request.mode(), request.original_scope());
    configs_->Freeze(unit, request.session_id());

    *response.mutable_session() = outcome.session;
    if (outcome.duplicate) {
      MarkReplay(response, "session already exists");
    } else {
      BATON_LOG_INFO("session created", {StringField("session_id", request.session_id()),
                                         IntField("scope_items", request.original_scope().items_size())});
    }
    return response;
  });
}

v1::CheckUnresolvedBlockingResponse Coordinator::CheckUnresolvedBlocking(const v1::CheckUnresolvedBlockingRequest& request) {
  return store_->Read([&](store::AtomicUnit& unit) {
    v1::CheckUnresolvedBlockingResponse response;
    unit.RequireSession(request.session_id());

    std::vector<std::string> group_ids;
    if (request.group_id().empty()) {
      for (const auto& group : unit.ListTaskGroups(request.session_id())) {
        group_ids.push_back(group.group_id());
      }
    } else {
      group_ids.push_back(unit.RequireTaskGroup(request.session_id(), request.group_id()).group_id());
    }

    ledger::IssueLedger ledger(unit);
    for (const auto& group_id : group_ids) {
      for (auto& unresolved : ledger.UnresolvedBlocking(request.session_id(), group_id)) {
        *response.add_unresolved() = std::move(unresolved);
      }
    }
    return response;
  });
}

v1::ValidateCompletionResponse Coordinator::ValidateCompletion(const v1::ValidateCompletionRequest& request) {
  return store_->Atomically(request.session_id(), [&](store::AtomicUnit& unit) {
    v1::ValidateCompletionResponse response;
    const auto session = unit.RequireSession(request.session_id());

    store::EventFilter filter;
    filter.session_id = request.session_id();
    filter.event_type = std::string(store::event_type::kValidatorVerdict);
    const auto key    = request.session_id() + ":verdict:" + std::to_string(unit.GetEvents(filter).size() + 1);

    *response.mutable_verdict() = RunGate(unit, session, key);
    return response;
  });
}

// ------------------------------------------------------------------
// Workflow surface
// ------------------------------------------------------------------

v1::ReportStatusResponse Coordinator::ReportStatus(const v1::ReportStatusRequest& request) {
  RequireRole(request.role());
  if (request.status_code().empty()) {
    throw util::ValidationError("status_code must not be empty");
  }

  const auto& session_id = request.session_id();
  const auto& group_id   = request.group_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::ReportStatusResponse response;
    const auto base = DedupBase(unit, session_id, "report", request.dedup_key());

    if (!request.dedup_key().empty()) {
      if (auto prior = Replayed(unit, util::DeriveDedupKey(base, "decision"), session_id, group_id, store::event_type::kRoutingDecision)) {
        *response.mutable_decision() = prior->payload().routing_decision();
        MarkReplay(response);
        return response;
      }
    }

    const auto group     = unit.RequireTaskGroup(session_id, group_id);
    bool       duplicate = false;
    if (auto stale = DropIfStale(unit, group, request.role(), request.status_code(), base, &duplicate)) {
      *response.mutable_decision() = *stale;
      if (duplicate) MarkReplay(response);
      return response;
    }

    workflow::TransitionEngine engine(configs_->Load(unit, session_id));

    workflow::TransitionInput input;
    input.role        = request.role();
    input.status_code = request.status_code();
    input.markers     = ToVector(request.markers());
    input.group       = group;

    auto outcome = RouteOrFailClosed(unit, engine, input, base);
    PlanTracks(unit, engine, outcome, base);
    Persist(unit, outcome, base);

    *response.mutable_decision() = outcome.decision;
    return response;
  });
}

v1::RecordReviewResponse Coordinator::RecordReview(const v1::RecordReviewRequest& request) {
  if (!model::IsReviewRole(request.reviewer())) {
    throw util::ValidationError("reviews come from REVIEWER or LEAD_REVIEWER, got " + v1::Role_Name(request.reviewer()));
  }

  const auto& session_id = request.session_id();
  const auto& group_id   = request.group_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::RecordReviewResponse response;
    const auto base = DedupBase(unit, session_id, "review", request.dedup_key());

    if (!request.dedup_key().empty()) {
      if (auto prior = Replayed(unit, base, session_id, group_id, store::event_type::kIssuesRaised)) {
        const auto& raised = prior->payload().issues_raised();
        const auto  counts = ledger::CountIssues(raised.issues());

        response.set_iteration(raised.iteration());
        response.set_review_status(workflow::DecideReview(counts.blocking, counts.non_blocking));
        response.set_blocking_count(counts.blocking);
        response.set_non_blocking_count(counts.non_blocking);
        *response.mutable_issues() = raised.issues();
        if (auto decision = unit.FindEvent(util::DeriveDedupKey(base, "decision"))) {
          *response.mutable_decision() = decision->payload().routing_decision();
        }
        MarkReplay(response);
        return response;
      }
    }

    auto group     = unit.RequireTaskGroup(session_id, group_id);
    bool duplicate = false;
    if (auto stale = DropIfStale(unit, group, request.reviewer(), std::string(kReviewStatus), base, &duplicate)) {
      *response.mutable_decision() = *stale;
      if (duplicate) MarkReplay(response);
      return response;
    }

    const auto                config = configs_->Load(unit, session_id);
    workflow::TransitionEngine engine(config);
    progress::ProgressTracker  tracker(config->Limits());
    ledger::IssueLedger        ledger(unit);

    const uint32_t iteration = group.review_iteration() + 1;
    const auto     record    = ledger.RecordReview(session_id, group_id, request.reviewer(), iteration, request.issues(), base);
    const auto     review_status = workflow::DecideReview(record.blocking_count, record.non_blocking_count);

    progress::ProgressObservation observation;
    observation.iteration               = iteration;
    observation.previous_blocking_count = group.blocking_issues_count();
    observation.current_blocking_count  = record.blocking_count;
    observation.no_progress_streak      = group.no_progress_count();
    observation.attempts                = group.attempts() + 1;
    const auto verdict                  = tracker.Evaluate(observation);

    if (verdict.warning) {
      BATON_LOG_WARN("no progress; next stalled iteration escalates",
                     {StringField("session_id", session_id), StringField("group_id", group_id), IntField("iteration", iteration),
                      IntField("streak", verdict.streak)});
    }

    group.set_review_iteration(iteration);
    group.set_blocking_issues_count(record.blocking_count);
    group.set_no_progress_count(verdict.streak);
    group.set_attempts(verdict.attempts);

    workflow::TransitionInput input;
    input.role               = request.reviewer();
    input.status_code        = workflow::ReviewStatusCode(review_status);
    input.group              = group;
    input.progress           = verdict;
    input.check_capabilities = false;

    auto outcome = RouteOrFailClosed(unit, engine, input, base);
    PlanTracks(unit, engine, outcome, base);
    Persist(unit, outcome, base);

    response.set_iteration(iteration);
    response.set_review_status(review_status);
    response.set_blocking_count(record.blocking_count);
    response.set_non_blocking_count(record.non_blocking_count);
    for (const auto& issue : record.issues) *response.add_issues() = issue;
    for (const auto& issue : record.dropped) *response.add_dropped() = issue;
    *response.mutable_progress() = progress::ToProto(verdict);
    *response.mutable_decision() = outcome.decision;
    return response;
  });
}

v1::RecordResponsesResponse Coordinator::RecordResponses(const v1::RecordResponsesRequest& request) {
  if (!model::IsImplementationRole(request.responder())) {
    throw util::ValidationError("responses come from an implementation role, got " + v1::Role_Name(request.responder()));
  }

  const auto& session_id = request.session_id();
  const auto& group_id   = request.group_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::RecordResponsesResponse response;
    const auto base = DedupBase(unit, session_id, "responses", request.dedup_key());

    if (!request.dedup_key().empty()) {
      if (auto prior = Replayed(unit, base, session_id, group_id, store::event_type::kIssueResponses)) {
        for (const auto& stored : prior->payload().issue_responses().responses()) {
          *response.add_responses() = stored;
          if (stored.status() == v1::RESPONSE_STATUS_REJECTED_AND_ACCEPTED) {
            response.add_auto_accepted(stored.issue_id());
          }
        }
        MarkReplay(response);
        return response;
      }
    }

    const auto group     = unit.RequireTaskGroup(session_id, group_id);
    bool       duplicate = false;
    if (auto stale = DropIfStale(unit, group, request.responder(), std::string(kResponsesStatus), base, &duplicate)) {
      response.mutable_result()->set_message(stale->reason());
      if (duplicate) MarkReplay(response, stale->reason());
      return response;
    }

    ledger::IssueLedger ledger(unit);
    const auto record =
        ledger.RecordResponses(session_id, group_id, request.responder(), request.iteration(), request.responses(), base);

    for (const auto& stored : record.responses) *response.add_responses() = stored;
    for (const auto& issue_id : record.auto_accepted) response.add_auto_accepted(issue_id);
    return response;
  });
}

v1::ReviewRejectionsResponse Coordinator::ReviewRejections(const v1::ReviewRejectionsRequest& request) {
  if (!model::IsReviewRole(request.reviewer())) {
    throw util::ValidationError("rejections are reviewed by REVIEWER or LEAD_REVIEWER, got " + v1::Role_Name(request.reviewer()));
  }

  const auto& session_id = request.session_id();
  const auto& group_id   = request.group_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::ReviewRejectionsResponse response;
    const auto base = DedupBase(unit, session_id, "rejections", request.dedup_key());

    if (!request.dedup_key().empty()) {
      if (auto prior = Replayed(unit, base, session_id, group_id, store::event_type::kIssueResponses)) {
        *response.mutable_responses() = prior->payload().issue_responses().responses();
        MarkReplay(response);
        return response;
      }
    }

    const auto group     = unit.RequireTaskGroup(session_id, group_id);
    bool       duplicate = false;
    if (auto stale = DropIfStale(unit, group, request.reviewer(), std::string(kRejectionsStatus), base, &duplicate)) {
      response.mutable_result()->set_message(stale->reason());
      if (duplicate) MarkReplay(response, stale->reason());
      return response;
    }

    ledger::IssueLedger ledger(unit);
    const auto          settled = ledger.ReviewRejections(session_id, group_id, request.reviewer(), request.iteration(),
                                                          ToVector(request.accepted_issue_ids()), ToVector(request.overruled_issue_ids()), base);

    BATON_LOG_INFO("rejections reviewed", {StringField("session_id", session_id), StringField("group_id", group_id),
                                           IntField("accepted", request.accepted_issue_ids_size()),
                                           IntField("overruled", request.overruled_issue_ids_size())});

    for (const auto& stored : settled) *response.add_responses() = stored;
    return response;
  });
}

v1::RecordTimeoutResponse Coordinator::RecordTimeout(const v1::RecordTimeoutRequest& request) {
  RequireRole(request.role());

  const auto& session_id = request.session_id();
  const auto& group_id   = request.group_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::RecordTimeoutResponse response;
    const auto base = DedupBase(unit, session_id, "timeout", request.dedup_key());

    if (!request.dedup_key().empty()) {
      if (Replayed(unit, base, session_id, group_id, store::event_type::kRoleTimeout)) {
        if (auto decision = unit.FindEvent(util::DeriveDedupKey(base, "decision"))) {
          *response.mutable_decision() = decision->payload().routing_decision();
        }
        MarkReplay(response);
        return response;
      }
    }

    auto       group     = unit.RequireTaskGroup(session_id, group_id);
    const auto code      = std::string(kTimeoutStatus);
    bool       duplicate = false;
    if (auto stale = DropIfStale(unit, group, request.role(), code, base, &duplicate)) {
      *response.mutable_decision() = *stale;
      if (duplicate) MarkReplay(response);
      return response;
    }

    v1::EventPayload timeout;
    timeout.mutable_role_timeout()->set_role(request.role());
    timeout.mutable_role_timeout()->set_deadline_ms(request.deadline_ms());
    unit.Append(session_id, group_id, timeout, base);

    BATON_LOG_WARN("role timed out", {StringField("session_id", session_id), StringField("group_id", group_id),
                                      StringField("role", v1::Role_Name(request.role()))});

    const auto                config = configs_->Load(unit, session_id);
    workflow::TransitionEngine engine(config);
    progress::ProgressTracker  tracker(config->Limits());

    progress::ProgressObservation observation;
    observation.iteration               = group.review_iteration();
    observation.previous_blocking_count = group.blocking_issues_count();
    observation.current_blocking_count  = group.blocking_issues_count();
    observation.no_progress_streak      = group.no_progress_count();
    observation.attempts                = group.attempts() + 1;
    observation.missed_deadline         = true;
    const auto verdict                  = tracker.Evaluate(observation);

    group.set_no_progress_count(verdict.streak);
    group.set_attempts(verdict.attempts);

    workflow::TransitionOutcome outcome;
    if (verdict.escalate || verdict.hard_cap) {
      try {
        outcome = engine.ApplyProgress(group, request.role(), code, verdict);
      } catch (const util::StateInconsistency& e) {
        outcome = FailClosedOnInconsistency(unit, engine, group, request.role(), code, e.what(), base);
      }
    } else {
      outcome = engine.Respawn(group, request.role(), code, "deadline passed without a report");
    }
    Persist(unit, outcome, base);

    *response.mutable_progress() = progress::ToProto(verdict);
    *response.mutable_decision() = outcome.decision;
    return response;
  });
}

v1::RequestEscalationResponse Coordinator::RequestEscalation(const v1::RequestEscalationRequest& request) {
  RequireRole(request.role());

  const auto& session_id = request.session_id();
  const auto& group_id   = request.group_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::RequestEscalationResponse response;
    const auto base = DedupBase(unit, session_id, "escalate", request.dedup_key());

    if (!request.dedup_key().empty()) {
      if (auto prior = Replayed(unit, util::DeriveDedupKey(base, "decision"), session_id, group_id, store::event_type::kRoutingDecision)) {
        *response.mutable_decision() = prior->payload().routing_decision();
        MarkReplay(response);
        return response;
      }
    }

    const auto group     = unit.RequireTaskGroup(session_id, group_id);
    const auto code      = std::string(kEscalationStatus);
    bool       duplicate = false;
    if (auto stale = DropIfStale(unit, group, request.role(), code, base, &duplicate)) {
      *response.mutable_decision() = *stale;
      if (duplicate) MarkReplay(response);
      return response;
    }

    workflow::TransitionEngine engine(configs_->Load(unit, session_id));
    ledger::IssueLedger        ledger(unit);

    const std::string reason =
        request.reason().empty() ? "escalation requested by " + v1::Role_Name(request.role()) : request.reason();

    workflow::TransitionOutcome outcome;
    if (!ledger.LatestIssuesRaised(session_id, group_id)) {
      outcome = FailClosedOnInconsistency(unit, engine, group, request.role(), code,
                                          "escalation requested for " + group_id + " without any issue history", base);
    } else {
      try {
        outcome = engine.EscalateFrom(group, request.role(), code, reason, group.no_progress_count());
      } catch (const util::StateInconsistency& e) {
        outcome = FailClosedOnInconsistency(unit, engine, group, request.role(), code, e.what(), base);
      }
    }
    Persist(unit, outcome, base);

    *response.mutable_decision() = outcome.decision;
    return response;
  });
}

v1::RecordScopeProgressResponse Coordinator::RecordScopeProgress(const v1::RecordScopeProgressRequest& request) {
  if (request.completed().empty() && !request.has_change()) {
    throw util::ValidationError("scope progress carries neither completed items nor a scope change");
  }
  if (request.has_change()) {
    if (request.change().approved_by() == v1::ROLE_UNSPECIFIED) {
      throw util::ValidationError("scope change needs an approving role");
    }
    if (request.change().removed_item_ids().empty()) {
      throw util::ValidationError("scope change removes no items");
    }
  }

  const auto& session_id = request.session_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::RecordScopeProgressResponse response;
    const auto session = unit.RequireSession(session_id);
    const auto base    = DedupBase(unit, session_id, "scope", request.dedup_key());

    std::set<std::string> scope_ids;
    for (const auto& item : session.original_scope().items()) {
      scope_ids.insert(item.item_id());
    }
    auto require_in_scope = [&](const std::string& item_id) {
      if (scope_ids.count(item_id) == 0) {
        throw util::ValidationError("item " + item_id + " is not part of the original scope");
      }
    };

    bool all_duplicate = true;
    for (const auto& completed : request.completed()) {
      require_in_scope(completed.item_id());

      v1::EventPayload payload;
      *payload.mutable_scope_item_completed() = completed;
      const auto appended = unit.Append(session_id, "", payload, util::DeriveDedupKey(base, "completed#" + completed.item_id()));
      all_duplicate       = all_duplicate && appended.duplicate;
    }

    if (request.has_change()) {
      for (const auto& item_id : request.change().removed_item_ids()) {
        require_in_scope(item_id);
      }

      v1::EventPayload payload;
      *payload.mutable_scope_change() = request.change();
      const auto appended = unit.Append(session_id, "", payload, util::DeriveDedupKey(base, "change"));
      all_duplicate       = all_duplicate && appended.duplicate;

      if (!appended.duplicate) {
        BATON_LOG_INFO("scope reduced", {StringField("session_id", session_id),
                                         IntField("removed", request.change().removed_item_ids_size()),
                                         StringField("approved_by", v1::Role_Name(request.change().approved_by()))});
      }
    }

    if (all_duplicate) MarkReplay(response);
    return response;
  });
}

v1::DeclareCompletionResponse Coordinator::DeclareCompletion(const v1::DeclareCompletionRequest& request) {
  if (request.role() != v1::ROLE_MANAGER) {
    throw util::ValidationError("only the MANAGER declares completion, got " + v1::Role_Name(request.role()));
  }

  const auto& session_id = request.session_id();

  return store_->Atomically(session_id, [&](store::AtomicUnit& unit) {
    v1::DeclareCompletionResponse response;
    const auto session     = unit.RequireSession(session_id);
    const auto base        = DedupBase(unit, session_id, "complete", request.dedup_key());
    const auto verdict_key = util::DeriveDedupKey(base, "verdict");

    if (!request.dedup_key().empty()) {
      if (auto prior = Replayed(unit, verdict_key, session_id, "", store::event_type::kValidatorVerdict)) {
        *response.mutable_verdict() = prior->payload().validator_verdict();
        MarkReplay(response);
        return response;
      }
    }

    v1::EventPayload declared;
    declared.mutable_completion_declared()->set_declared_by(request.role());
    declared.mutable_completion_declared()->set_summary(request.summary());
    unit.Append(session_id, "", declared, base);

    BATON_LOG_INFO("completion declared", {StringField("session_id", session_id), BoolField("already_completed",
                                                                                            session.status() == v1::SESSION_STATUS_COMPLETED)});

    *response.mutable_verdict() = RunGate(unit, session, verdict_key);
    return response;
  });
}

void Coordinator::ReplaceWorkflow(v1::WorkflowConfig workflow) {
  configs_->ReplaceLive(std::move(workflow));
  BATON_LOG_INFO("live workflow replaced; applies to new sessions");
}

} // namespace baton::core
