#pragma once

#include "baton/coordination/v1.hpp"
#include "service_context.hpp"

namespace baton::service {

/*
  In-process command surface. Store calls go straight to the store,
  workflow calls through the coordinator. Failures are thrown as
  util errors; successful responses carry RESULT_TAG_OK or, for a
  duplicate dedup key, RESULT_TAG_CONFLICT.
*/
class CoordinationService {
 public:
  explicit CoordinationService(ServiceContext ctx);

  baton::coordination::v1::CreateSessionResponse CreateSession(const baton::coordination::v1::CreateSessionRequest& req);
  baton::coordination::v1::GetSessionResponse    GetSession(const baton::coordination::v1::GetSessionRequest& req);
  baton::coordination::v1::ListSessionsResponse  ListSessions(const baton::coordination::v1::ListSessionsRequest& req);

  baton::coordination::v1::UpsertTaskGroupResponse UpsertTaskGroup(const baton::coordination::v1::UpsertTaskGroupRequest& req);
  baton::coordination::v1::GetTaskGroupResponse    GetTaskGroup(const baton::coordination::v1::GetTaskGroupRequest& req);
  baton::coordination::v1::ListTaskGroupsResponse  ListTaskGroups(const baton::coordination::v1::ListTaskGroupsRequest& req);

  baton::coordination::v1::AppendEventResponse AppendEvent(const baton::coordination::v1::AppendEventRequest& req);
  baton::coordination::v1::GetEventsResponse   GetEvents(const baton::coordination::v1::GetEventsRequest& req);

  baton::coordination::v1::UpsertStateResponse UpsertState(const baton::coordination::v1::UpsertStateRequest& req);
  baton::coordination::v1::GetStateResponse    GetState(const baton::coordination::v1::GetStateRequest& req);

  baton::coordination::v1::CheckUnresolvedBlockingResponse CheckUnresolvedBlocking(
      const baton::coordination::v1::CheckUnresolvedBlockingRequest& req);
  baton::coordination::v1::ValidateCompletionResponse ValidateCompletion(const baton::coordination::v1::ValidateCompletionRequest& req);

  baton::coordination::v1::ReportStatusResponse      ReportStatus(const baton::coordination::v1::ReportStatusRequest& req);
  baton::coordination::v1::RecordReviewResponse      RecordReview(const baton::coordination::v1::RecordReviewRequest& req);
  baton::coordination::v1::RecordResponsesResponse   RecordResponses(const baton::coordination::v1::RecordResponsesRequest& req);
  baton::coordination::v1::ReviewRejectionsResponse  ReviewRejections(const baton::coordination::v1::ReviewRejectionsRequest& req);
  baton::coordination::v1::RecordTimeoutResponse     RecordTimeout(const baton::coordination::v1::RecordTimeoutRequest& req);
  baton::coordination::v1::RequestEscalationResponse RequestEscalation(const baton::coordination::v1::RequestEscalationRequest& req);
  baton::coordination::v1::RecordScopeProgressResponse RecordScopeProgress(
      const baton::coordination::v1::RecordScopeProgressRequest& req);
  baton::coordination::v1::DeclareCompletionResponse DeclareCompletion(const baton::coordination::v1::DeclareCompletionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace baton::service
