#include "coordination_service.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/core/coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/util/errors.hpp"

namespace baton::service {

namespace v1 = baton::coordination::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& session_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!session_id.empty()) {
    span.SetAttribute("session.id", session_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    const auto elapsed = elapsed_ms();
    BATON_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("session_id", session_id),
                                   observability::StringField("error", ex.what()),
                                   observability::IntField("elapsed_ms", static_cast<std::int64_t>(elapsed))});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed);
    throw;
  }
}

template <typename Response>
void MarkDuplicate(Response& resp, const std::string& message) {
  resp.mutable_result()->set_tag(v1::RESULT_TAG_CONFLICT);
  resp.mutable_result()->set_message(message);
}

} // namespace

CoordinationService::CoordinationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.coordinator) {
    throw std::invalid_argument("coordination service requires a store and a coordinator");
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

v1::CreateSessionResponse CoordinationService::CreateSession(const v1::CreateSessionRequest& req) {
  return ObserveRpc("CoordinationService.CreateSession", req.session_id(), [&] { return ctx_.coordinator->CreateSession(req); });
}

v1::GetSessionResponse CoordinationService::GetSession(const v1::GetSessionRequest& req) {
  return ObserveRpc("CoordinationService.GetSession", req.session_id(), [&] {
    auto session = ctx_.store->GetSession(req.session_id());
    if (!session) {
      throw util::NotFound("session not found: " + req.session_id());
    }
    v1::GetSessionResponse resp;
    *resp.mutable_session() = std::move(*session);
    return resp;
  });
}

v1::ListSessionsResponse CoordinationService::ListSessions(const v1::ListSessionsRequest& req) {
  return ObserveRpc("CoordinationService.ListSessions", "", [&] {
    v1::ListSessionsResponse resp;
    for (auto& session : ctx_.store->ListSessions(req.limit())) {
      *resp.add_sessions() = std::move(session);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Task groups
// ------------------------------------------------------------------

v1::UpsertTaskGroupResponse CoordinationService::UpsertTaskGroup(const v1::UpsertTaskGroupRequest& req) {
  return ObserveRpc("CoordinationService.UpsertTaskGroup", req.group().session_id(), [&] {
    v1::UpsertTaskGroupResponse resp;
    *resp.mutable_group() = ctx_.store->UpsertTaskGroup(req.group());
    return resp;
  });
}

v1::GetTaskGroupResponse CoordinationService::GetTaskGroup(const v1::GetTaskGroupRequest& req) {
  return ObserveRpc("CoordinationService.GetTaskGroup", req.session_id(), [&] {
    auto group = ctx_.store->GetTaskGroup(req.session_id(), req.group_id());
    if (!group) {
      throw util::NotFound("task group not found: " + req.session_id() + "/" + req.group_id());
    }
    v1::GetTaskGroupResponse resp;
    *resp.mutable_group() = std::move(*group);
    return resp;
  });
}

v1::ListTaskGroupsResponse CoordinationService::ListTaskGroups(const v1::ListTaskGroupsRequest& req) {
  return ObserveRpc("CoordinationService.ListTaskGroups", req.session_id(), [&] {
    return ctx_.store->Read([&](store::AtomicUnit& unit) {
      unit.RequireSession(req.session_id());
      v1::ListTaskGroupsResponse resp;
      for (auto& group : unit.ListTaskGroups(req.session_id())) {
        *resp.add_groups() = std::move(group);
      }
      return resp;
    });
  });
}

// ------------------------------------------------------------------
// Events and state
// ------------------------------------------------------------------

v1::AppendEventResponse CoordinationService::AppendEvent(const v1::AppendEventRequest& req) {
  return ObserveRpc("CoordinationService.AppendEvent", req.session_id(), [&] {
    const auto outcome = ctx_.store->AppendEvent(req.session_id(), req.group_id(), req.event_type(), req.payload(), req.dedup_key());

    v1::AppendEventResponse resp;
    resp.set_sequence(outcome.sequence);
    resp.set_duplicate(outcome.duplicate);
    if (outcome.duplicate) {
      MarkDuplicate(resp, "dedup key already applied");
    }
    return resp;
  });
}

v1::GetEventsResponse CoordinationService::GetEvents(const v1::GetEventsRequest& req) {
  return ObserveRpc("CoordinationService.GetEvents", req.session_id(), [&] {
    store::EventFilter filter;
    filter.session_id = req.session_id();
    if (!req.group_id().empty()) filter.group_id = req.group_id();
    if (!req.event_type().empty()) filter.event_type = req.event_type();
    filter.within_ms = req.within_ms();
    filter.limit     = req.limit();

    return ctx_.store->Read([&](store::AtomicUnit& unit) {
      unit.RequireSession(req.session_id());
      v1::GetEventsResponse resp;
      for (auto& event : unit.GetEvents(filter)) {
        *resp.add_events() = std::move(event);
      }
      return resp;
    });
  });
}

v1::UpsertStateResponse CoordinationService::UpsertState(const v1::UpsertStateRequest& req) {
  return ObserveRpc("CoordinationService.UpsertState", req.session_id(), [&] {
    ctx_.store->UpsertState(req.session_id(), req.scope(), req.state_type(), req.payload_json());
    return v1::UpsertStateResponse{};
  });
}

v1::GetStateResponse CoordinationService::GetState(const v1::GetStateRequest& req) {
  return ObserveRpc("CoordinationService.GetState", req.session_id(), [&] {
    const auto snapshot = ctx_.store->Read([&](store::AtomicUnit& unit) {
      unit.RequireSession(req.session_id());
      return unit.GetState(req.session_id(), req.scope(), req.state_type());
    });

    v1::GetStateResponse resp;
    resp.set_found(snapshot.found);
    resp.set_payload_json(snapshot.payload_json);
    resp.set_updated_at_ms(snapshot.updated_at_ms);
    return resp;
  });
}

v1::CheckUnresolvedBlockingResponse CoordinationService::CheckUnresolvedBlocking(const v1::CheckUnresolvedBlockingRequest& req) {
  return ObserveRpc("CoordinationService.CheckUnresolvedBlocking", req.session_id(),
                    [&] { return ctx_.coordinator->CheckUnresolvedBlocking(req); });
}

v1::ValidateCompletionResponse CoordinationService::ValidateCompletion(const v1::ValidateCompletionRequest& req) {
  return ObserveRpc("CoordinationService.ValidateCompletion", req.session_id(), [&] { return ctx_.coordinator->ValidateCompletion(req); });
}

// ------------------------------------------------------------------
// Workflow
// ------------------------------------------------------------------

v1::ReportStatusResponse CoordinationService::ReportStatus(const v1::ReportStatusRequest& req) {
  return ObserveRpc("CoordinationService.ReportStatus", req.session_id(), [&] { return ctx_.coordinator->ReportStatus(req); });
}

v1::RecordReviewResponse CoordinationService::RecordReview(const v1::RecordReviewRequest& req) {
  return ObserveRpc("CoordinationService.RecordReview", req.session_id(), [&] { return ctx_.coordinator->RecordReview(req); });
}

v1::RecordResponsesResponse CoordinationService::RecordResponses(const v1::RecordResponsesRequest& req) {
  return ObserveRpc("CoordinationService.RecordResponses", req.session_id(), [&] { return ctx_.coordinator->RecordResponses(req); });
}

v1::ReviewRejectionsResponse CoordinationService::ReviewRejections(const v1::ReviewRejectionsRequest& req) {
  return ObserveRpc("CoordinationService.ReviewRejections", req.session_id(), [&] { return ctx_.coordinator->ReviewRejections(req); });
}

v1::RecordTimeoutResponse CoordinationService::RecordTimeout(const v1::RecordTimeoutRequest& req) {
  return ObserveRpc("CoordinationService.RecordTimeout", req.session_id(), [&] { return ctx_.coordinator->RecordTimeout(req); });
}

v1::RequestEscalationResponse CoordinationService::RequestEscalation(const v1::RequestEscalationRequest& req) {
  return ObserveRpc("CoordinationService.RequestEscalation", req.session_id(), [&] { return ctx_.coordinator->RequestEscalation(req); });
}

v1::RecordScopeProgressResponse CoordinationService::RecordScopeProgress(const v1::RecordScopeProgressRequest& req) {
  return ObserveRpc("CoordinationService.RecordScopeProgress", req.session_id(),
                    [&] { return ctx_.coordinator->RecordScopeProgress(req); });
}

v1::DeclareCompletionResponse CoordinationService::DeclareCompletion(const v1::DeclareCompletionRequest& req) {
  return ObserveRpc("CoordinationService.DeclareCompletion", req.session_id(), [&] { return ctx_.coordinator->DeclareCompletion(req); });
}

} // namespace baton::service
