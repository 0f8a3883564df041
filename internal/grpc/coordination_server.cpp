#include "coordination_server.hpp"

#include "grpc_error.hpp"

namespace baton::grpc {

namespace v1 = baton::coordination::v1;

namespace {

template <typename Response, typename Fn>
::grpc::Status Serve(::grpc::ServerContext* ctx, Response* resp, Fn&& fn) {
  try {
    *resp = fn();
    if (ctx) ctx->AddTrailingMetadata(kResultMetadataKey, ResultTagName(resp->result().tag()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    if (ctx) ctx->AddTrailingMetadata(kResultMetadataKey, ResultTagName(ResultTagFor(e)));
    return ToStatus(e);
  }
}

} // namespace

CoordinationServer::CoordinationServer(std::shared_ptr<baton::service::CoordinationService> svc) : service_(std::move(svc)) {
}

::grpc::Status CoordinationServer::CreateSession(::grpc::ServerContext* ctx, const v1::CreateSessionRequest* req, v1::CreateSessionResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->CreateSession(*req); });
}

::grpc::Status CoordinationServer::GetSession(::grpc::ServerContext* ctx, const v1::GetSessionRequest* req, v1::GetSessionResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->GetSession(*req); });
}

::grpc::Status CoordinationServer::ListSessions(::grpc::ServerContext* ctx, const v1::ListSessionsRequest* req, v1::ListSessionsResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ListSessions(*req); });
}

::grpc::Status CoordinationServer::UpsertTaskGroup(::grpc::ServerContext* ctx, const v1::UpsertTaskGroupRequest* req, v1::UpsertTaskGroupResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->UpsertTaskGroup(*req); });
}

::grpc::Status CoordinationServer::GetTaskGroup(::grpc::ServerContext* ctx, const v1::GetTaskGroupRequest* req, v1::GetTaskGroupResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->GetTaskGroup(*req); });
}

::grpc::Status CoordinationServer::ListTaskGroups(::grpc::ServerContext* ctx, const v1::ListTaskGroupsRequest* req, v1::ListTaskGroupsResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ListTaskGroups(*req); });
}

::grpc::Status CoordinationServer::AppendEvent(::grpc::ServerContext* ctx, const v1::AppendEventRequest* req, v1::AppendEventResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->AppendEvent(*req); });
}

::grpc::Status CoordinationServer::GetEvents(::grpc::ServerContext* ctx, const v1::GetEventsRequest* req, v1::GetEventsResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->GetEvents(*req); });
}

::grpc::Status CoordinationServer::UpsertState(::grpc::ServerContext* ctx, const v1::UpsertStateRequest* req, v1::UpsertStateResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->UpsertState(*req); });
}

::grpc::Status CoordinationServer::GetState(::grpc::ServerContext* ctx, const v1::GetStateRequest* req, v1::GetStateResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->GetState(*req); });
}

::grpc::Status CoordinationServer::CheckUnresolvedBlocking(::grpc::ServerContext* ctx, const v1::CheckUnresolvedBlockingRequest* req, v1::CheckUnresolvedBlockingResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->CheckUnresolvedBlocking(*req); });
}

::grpc::Status CoordinationServer::ValidateCompletion(::grpc::ServerContext* ctx, const v1::ValidateCompletionRequest* req, v1::ValidateCompletionResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ValidateCompletion(*req); });
}

::grpc::Status CoordinationServer::ReportStatus(::grpc::ServerContext* ctx, const v1::ReportStatusRequest* req, v1::ReportStatusResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ReportStatus(*req); });
}

::grpc::Status CoordinationServer::RecordReview(::grpc::ServerContext* ctx, const v1::RecordReviewRequest* req, v1::RecordReviewResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RecordReview(*req); });
}

::grpc::Status CoordinationServer::RecordResponses(::grpc::ServerContext* ctx, const v1::RecordResponsesRequest* req, v1::RecordResponsesResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RecordResponses(*req); });
}

::grpc::Status CoordinationServer::ReviewRejections(::grpc::ServerContext* ctx, const v1::ReviewRejectionsRequest* req, v1::ReviewRejectionsResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ReviewRejections(*req); });
}

::grpc::Status CoordinationServer::RecordTimeout(::grpc::ServerContext* ctx, const v1::RecordTimeoutRequest* req, v1::RecordTimeoutResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RecordTimeout(*req); });
}

::grpc::Status CoordinationServer::RequestEscalation(::grpc::ServerContext* ctx, const v1::RequestEscalationRequest* req, v1::RequestEscalationResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RequestEscalation(*req); });
}

::grpc::Status CoordinationServer::RecordScopeProgress(::grpc::ServerContext* ctx, const v1::RecordScopeProgressRequest* req, v1::RecordScopeProgressResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RecordScopeProgress(*req); });
}

::grpc::Status CoordinationServer::DeclareCompletion(::grpc::ServerContext* ctx, const v1::DeclareCompletionRequest* req, v1::DeclareCompletionResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->DeclareCompletion(*req); });
}

} // namespace baton::grpc
