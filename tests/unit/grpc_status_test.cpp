#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/coordination_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/coordination_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/workflow/session_config.hpp"

namespace {

namespace v1 = baton::coordination::v1;

std::unique_ptr<baton::grpc::CoordinationServer> BuildServer() {
  baton::service::ServiceContext ctx;
  ctx.store       = std::make_shared<baton::store::CoordinationStore>(std::make_shared<baton::db::memory::MemoryRepository>());
  auto configs    = std::make_shared<baton::workflow::SessionConfigCache>(baton::workflow::DefaultWorkflowConfig());
  ctx.coordinator = std::make_shared<baton::core::Coordinator>(ctx.store, configs);
  return std::make_unique<baton::grpc::CoordinationServer>(std::make_shared<baton::service::CoordinationService>(ctx));
}

void TestExceptionMapping() {
  using baton::grpc::ResultTagFor;
  using baton::grpc::ToStatus;

  assert(ToStatus(baton::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(baton::util::NotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(baton::util::ConflictError("taken")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(baton::util::StateInconsistency("odd")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(baton::util::StoreUnavailable("down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(baton::util::NotFound("gone")).error_message() == "gone");

  assert(ResultTagFor(baton::util::ValidationError("bad")) == v1::RESULT_TAG_VALIDATION_ERROR);
  assert(ResultTagFor(baton::util::ConflictError("taken")) == v1::RESULT_TAG_CONFLICT);
  assert(ToStatus(baton::util::DedupKeyReused("k1 reused")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ResultTagFor(baton::util::DedupKeyReused("k1 reused")) == v1::RESULT_TAG_VALIDATION_ERROR);
  assert(ResultTagFor(std::runtime_error("boom")) == v1::RESULT_TAG_INTERNAL_ERROR);

  assert(baton::grpc::ResultTagName(v1::RESULT_TAG_OK) == "ok");
  assert(baton::grpc::ResultTagName(v1::RESULT_TAG_VALIDATION_ERROR) == "validation_error");
  assert(baton::grpc::ResultTagName(v1::RESULT_TAG_NOT_FOUND) == "not_found");
  assert(baton::grpc::ResultTagName(v1::RESULT_TAG_CONFLICT) == "conflict");
}

void TestMissingSessionReturnsNotFound() {
  auto server = BuildServer();

  v1::GetSessionRequest req;
  req.set_session_id("missing");
  v1::GetSessionResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server->GetSession(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMalformedSessionIdReturnsInvalidArgument() {
  auto server = BuildServer();

  v1::CreateSessionRequest req;
  req.set_session_id("has spaces");
  v1::CreateSessionResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = server->CreateSession(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestDuplicateSessionIsOkWithConflictTag() {
  auto server = BuildServer();

  v1::CreateSessionRequest req;
  req.set_session_id("s1");
  v1::CreateSessionResponse first;
  v1::CreateSessionResponse second;
  ::grpc::ServerContext     ctx1;
  ::grpc::ServerContext     ctx2;

  assert(server->CreateSession(&ctx1, &req, &first).ok());
  assert(first.result().tag() == v1::RESULT_TAG_OK);
  assert(server->CreateSession(&ctx2, &req, &second).ok());
  assert(second.result().tag() == v1::RESULT_TAG_CONFLICT);
}

void TestForbiddenTaskGroupEdgeReturnsFailedPrecondition() {
  auto server = BuildServer();

  v1::CreateSessionRequest create;
  create.set_session_id("s1");
  v1::CreateSessionResponse created;
  ::grpc::ServerContext     create_ctx;
  assert(server->CreateSession(&create_ctx, &create, &created).ok());

  v1::UpsertTaskGroupRequest req;
  req.mutable_group()->set_session_id("s1");
  req.mutable_group()->set_group_id("g1");
  req.mutable_group()->set_status(v1::GROUP_STATUS_APPROVED);
  v1::UpsertTaskGroupResponse resp;
  ::grpc::ServerContext       grpc_ctx;

  const auto status = server->UpsertTaskGroup(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUnknownGroupReportReturnsNotFound() {
  auto server = BuildServer();

  v1::CreateSessionRequest create;
  create.set_session_id("s1");
  v1::CreateSessionResponse created;
  ::grpc::ServerContext     create_ctx;
  assert(server->CreateSession(&create_ctx, &create, &created).ok());

  v1::ReportStatusRequest req;
  req.set_session_id("s1");
  req.set_group_id("nope");
  req.set_role(v1::ROLE_MANAGER);
  req.set_status_code("CONTINUE");
  v1::ReportStatusResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server->ReportStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingSessionReturnsNotFound();
  TestMalformedSessionIdReturnsInvalidArgument();
  TestDuplicateSessionIsOkWithConflictTag();
  TestForbiddenTaskGroupEdgeReturnsFailedPrecondition();
  TestUnknownGroupReportReturnsNotFound();

  std::cout << "baton_unit_grpc_status: pass\n";
  return 0;
}
