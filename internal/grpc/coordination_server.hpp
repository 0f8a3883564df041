#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "baton/coordination/v1/coordination_service.grpc.pb.h"
#include "internal/service/coordination_service.hpp"

namespace baton::grpc {

/*
  gRPC adapter over CoordinationService. Every reply carries the result
  tag name as "baton-result" trailing metadata.
*/
class CoordinationServer final : public baton::coordination::v1::CoordinationService::Service {
 public:
  explicit CoordinationServer(std::shared_ptr<baton::service::CoordinationService> svc);

  ::grpc::Status CreateSession(::grpc::ServerContext* ctx, const baton::coordination::v1::CreateSessionRequest* req,
                               baton::coordination::v1::CreateSessionResponse* resp) override;

  ::grpc::Status GetSession(::grpc::ServerContext* ctx, const baton::coordination::v1::GetSessionRequest* req,
                            baton::coordination::v1::GetSessionResponse* resp) override;

  ::grpc::Status ListSessions(::grpc::ServerContext* ctx, const baton::coordination::v1::ListSessionsRequest* req,
                              baton::coordination::v1::ListSessionsResponse* resp) override;

  ::grpc::Status UpsertTaskGroup(::grpc::ServerContext* ctx, const baton::coordination::v1::UpsertTaskGroupRequest* req,
                                 baton::coordination::v1::UpsertTaskGroupResponse* resp) override;

  ::grpc::Status GetTaskGroup(::grpc::ServerContext* ctx, const baton::coordination::v1::GetTaskGroupRequest* req,
                              baton::coordination::v1::GetTaskGroupResponse* resp) override;

  ::grpc::Status ListTaskGroups(::grpc::ServerContext* ctx, const baton::coordination::v1::ListTaskGroupsRequest* req,
                                baton::coordination::v1::ListTaskGroupsResponse* resp) override;

  ::grpc::Status AppendEvent(::grpc::ServerContext* ctx, const baton::coordination::v1::AppendEventRequest* req,
                             baton::coordination::v1::AppendEventResponse* resp) override;

  ::grpc::Status GetEvents(::grpc::ServerContext* ctx, const baton::coordination::v1::GetEventsRequest* req,
                           baton::coordination::v1::GetEventsResponse* resp) override;

  ::grpc::Status UpsertState(::grpc::ServerContext* ctx, const baton::coordination::v1::UpsertStateRequest* req,
                             baton::coordination::v1::UpsertStateResponse* resp) override;

  ::grpc::Status GetState(::grpc::ServerContext* ctx, const baton::coordination::v1::GetStateRequest* req,
                          baton::coordination::v1::GetStateResponse* resp) override;

  ::grpc::Status CheckUnresolvedBlocking(::grpc::ServerContext* ctx, const baton::coordination::v1::CheckUnresolvedBlockingRequest* req,
                                         baton::coordination::v1::CheckUnresolvedBlockingResponse* resp) override;

  ::grpc::Status ValidateCompletion(::grpc::ServerContext* ctx, const baton::coordination::v1::ValidateCompletionRequest* req,
                                    baton::coordination::v1::ValidateCompletionResponse* resp) override;

  ::grpc::Status ReportStatus(::grpc::ServerContext* ctx, const baton::coordination::v1::ReportStatusRequest* req,
                              baton::coordination::v1::ReportStatusResponse* resp) override;

  ::grpc::Status RecordReview(::grpc::ServerContext* ctx, const baton::coordination::v1::RecordReviewRequest* req,
                              baton::coordination::v1::RecordReviewResponse* resp) override;

  ::grpc::Status RecordResponses(::grpc::ServerContext* ctx, const baton::coordination::v1::RecordResponsesRequest* req,
                                 baton::coordination::v1::RecordResponsesResponse* resp) override;

  ::grpc::Status ReviewRejections(::grpc::ServerContext* ctx, const baton::coordination::v1::ReviewRejectionsRequest* req,
                                  baton::coordination::v1::ReviewRejectionsResponse* resp) override;

  ::grpc::Status RecordTimeout(::grpc::ServerContext* ctx, const baton::coordination::v1::RecordTimeoutRequest* req,
                               baton::coordination::v1::RecordTimeoutResponse* resp) override;

  ::grpc::Status RequestEscalation(::grpc::ServerContext* ctx, const baton::coordination::v1::RequestEscalationRequest* req,
                                   baton::coordination::v1::RequestEscalationResponse* resp) override;

  ::grpc::Status RecordScopeProgress(::grpc::ServerContext* ctx, const baton::coordination::v1::RecordScopeProgressRequest* req,
                                     baton::coordination::v1::RecordScopeProgressResponse* resp) override;

  ::grpc::Status DeclareCompletion(::grpc::ServerContext* ctx, const baton::coordination::v1::DeclareCompletionRequest* req,
                                   baton::coordination::v1::DeclareCompletionResponse* resp) override;

 private:
  std::shared_ptr<baton::service::CoordinationService> service_;
};

} // namespace baton::grpc
