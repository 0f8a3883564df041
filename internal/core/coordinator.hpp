#pragma once

#include <memory>
#include <optional>
#include <string>

#include "baton/coordination/v1.hpp"
#include "internal/workflow/session_config.hpp"
#include "internal/workflow/transition_engine.hpp"

namespace baton::store {
class AtomicUnit;
class CoordinationStore;
} // namespace baton::store

namespace baton::core {

/*
  Coordinator

  Drives one workflow step per call: role report -> transition engine ->
  progress tracker -> issue ledger -> store. Each call runs inside a single
  CoordinationStore::Atomically() unit, so a failed step leaves nothing
  behind.

  Retries: a call carrying a dedup_key that was already applied replays the
  stored outcome and tags the result CONFLICT. Calls without one get a key
  derived from the session's event sequence and are not replayable.

  Derived event keys ("<key>#decision", "#escalation", "#stale",
  "#inconsistency", "#verdict", "#dispatch:<group>") hang off the request key.
*/
class Coordinator {
 public:
  Coordinator(std::shared_ptr<store::CoordinationStore> store, std::shared_ptr<workflow::SessionConfigCache> configs);

  // Creates the session (idempotent) and freezes the live workflow into it.
  baton::coordination::v1::CreateSessionResponse CreateSession(const baton::coordination::v1::CreateSessionRequest& request);

  baton::coordination::v1::CheckUnresolvedBlockingResponse CheckUnresolvedBlocking(
      const baton::coordination::v1::CheckUnresolvedBlockingRequest& request);

  baton::coordination::v1::ValidateCompletionResponse ValidateCompletion(const baton::coordination::v1::ValidateCompletionRequest& request);

  baton::coordination::v1::ReportStatusResponse ReportStatus(const baton::coordination::v1::ReportStatusRequest& request);

  baton::coordination::v1::RecordReviewResponse RecordReview(const baton::coordination::v1::RecordReviewRequest& request);

  baton::coordination::v1::RecordResponsesResponse RecordResponses(const baton::coordination::v1::RecordResponsesRequest& request);

  baton::coordination::v1::ReviewRejectionsResponse ReviewRejections(const baton::coordination::v1::ReviewRejectionsRequest& request);

  baton::coordination::v1::RecordTimeoutResponse RecordTimeout(const baton::coordination::v1::RecordTimeoutRequest& request);

  baton::coordination::v1::RequestEscalationResponse RequestEscalation(const baton::coordination::v1::RequestEscalationRequest& request);

  baton::coordination::v1::RecordScopeProgressResponse RecordScopeProgress(
      const baton::coordination::v1::RecordScopeProgressRequest& request);

  baton::coordination::v1::DeclareCompletionResponse DeclareCompletion(const baton::coordination::v1::DeclareCompletionRequest& request);

  // Affects sessions created afterwards only.
  void ReplaceWorkflow(baton::coordination::v1::WorkflowConfig workflow);

 private:
  std::optional<baton::coordination::v1::RoutingDecision> DropIfStale(store::AtomicUnit& unit, const baton::coordination::v1::TaskGroup& group,
                                                                      baton::coordination::v1::Role role, const std::string& status_code,
                                                                      const std::string& dedup_base, bool* duplicate);

  workflow::TransitionOutcome RouteOrFailClosed(store::AtomicUnit& unit, const workflow::TransitionEngine& engine,
                                                const workflow::TransitionInput& input, const std::string& dedup_base);

  workflow::TransitionOutcome FailClosedOnInconsistency(store::AtomicUnit& unit, const workflow::TransitionEngine& engine,
                                                        const baton::coordination::v1::TaskGroup& group, baton::coordination::v1::Role role,
                                                        const std::string& status_code, const std::string& error,
                                                        const std::string& dedup_base);

  void Persist(store::AtomicUnit& unit, const workflow::TransitionOutcome& outcome, const std::string& dedup_base);

  // Multi-track sessions: hands out PENDING groups up to max_parallel in
  // flight, or flags the phase complete once nothing is left.
  void PlanTracks(store::AtomicUnit& unit, const workflow::TransitionEngine& engine, workflow::TransitionOutcome& outcome,
                  const std::string& dedup_base);

  baton::coordination::v1::ValidatorVerdict RunGate(store::AtomicUnit& unit, const baton::coordination::v1::Session& session,
                                                    const std::string& verdict_key);

  std::shared_ptr<store::CoordinationStore>     store_;
  std::shared_ptr<workflow::SessionConfigCache> configs_;
};

} // namespace baton::core
