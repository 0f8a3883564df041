#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/store/event_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifiers.hpp"
#include "internal/workflow/session_config.hpp"

namespace {

namespace v1 = baton::coordination::v1;
using baton::core::Coordinator;
using baton::store::CoordinationStore;

struct Harness {
  std::shared_ptr<CoordinationStore>                  store;
  std::shared_ptr<baton::workflow::SessionConfigCache> configs;
  std::shared_ptr<Coordinator>                        coordinator;
};

Harness NewHarness(std::shared_ptr<CoordinationStore> store = nullptr) {
  Harness h;
  h.store       = store ? store : std::make_shared<CoordinationStore>(std::make_shared<baton::db::memory::MemoryRepository>());
  h.configs     = std::make_shared<baton::workflow::SessionConfigCache>(baton::workflow::DefaultWorkflowConfig());
  h.coordinator = std::make_shared<Coordinator>(h.store, h.configs);
  return h;
}

void StartSession(Harness& h, const std::string& session_id, const std::string& group_name = "csv importer") {
  v1::CreateSessionRequest request;
  request.set_session_id(session_id);
  request.mutable_original_scope()->add_items()->set_item_id("importer");
  h.coordinator->CreateSession(request);

  v1::TaskGroup group;
  group.set_session_id(session_id);
  group.set_group_id("g1");
  group.set_name(group_name);
  h.store->UpsertTaskGroup(group);
}

v1::ReportStatusRequest ReportRequest(v1::Role role, const std::string& code, const std::string& dedup_key = "",
                                      const std::string& session_id = "s1") {
  v1::ReportStatusRequest request;
  request.set_session_id(session_id);
  request.set_group_id("g1");
  request.set_role(role);
  request.set_status_code(code);
  request.add_markers("status");
  request.set_dedup_key(dedup_key);
  return request;
}

v1::RecordReviewRequest ReviewRequest(std::vector<v1::Issue> issues, const std::string& dedup_key = "") {
  v1::RecordReviewRequest request;
  request.set_session_id("s1");
  request.set_group_id("g1");
  request.set_reviewer(v1::ROLE_REVIEWER);
  request.set_dedup_key(dedup_key);
  for (auto& issue : issues) *request.add_issues() = std::move(issue);
  return request;
}

v1::Issue NewIssue(bool blocking, const std::string& title, const std::string& issue_id = "") {
  v1::Issue issue;
  issue.set_issue_id(issue_id);
  issue.set_blocking(blocking);
  issue.set_title(title);
  issue.set_location("src/import.cc:42");
  return issue;
}

std::vector<v1::Event> Events(Harness& h, const std::string& type, const std::string& session_id = "s1") {
  baton::store::EventFilter filter;
  filter.session_id = session_id;
  filter.event_type = type;
  return h.store->GetEvents(filter);
}

void ReachReview(Harness& h) {
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_REVIEW"));
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const baton::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestDuplicateSessionIsTaggedConflict() {
  auto h = NewHarness();
  StartSession(h, "s1");

  v1::CreateSessionRequest again;
  again.set_session_id("s1");
  const auto response = h.coordinator->CreateSession(again);
  assert(response.result().tag() == v1::RESULT_TAG_CONFLICT);
  assert(response.result().message() == "session already exists");
  assert(response.session().original_scope().items_size() == 1);

  const auto snapshot = h.store->GetState("s1", "global", std::string(baton::workflow::kWorkflowConfigStateType));
  assert(snapshot.found);
}

void TestRetriedReportReplaysDecision() {
  auto h = NewHarness();
  StartSession(h, "s1");

  const auto first = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE", "mgr-plan-1"));
  assert(first.result().tag() == v1::RESULT_TAG_OK);

  const auto retry = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE", "mgr-plan-1"));
  assert(retry.result().tag() == v1::RESULT_TAG_CONFLICT);
  assert(retry.result().message() == "replayed");
  assert(retry.decision().next_role() == first.decision().next_role());
  assert(retry.decision().group_status() == first.decision().group_status());
  assert(Events(h, "routing_decision").size() == 1);

  // The same key on a different group is a client bug, not a retry.
  v1::TaskGroup other;
  other.set_session_id("s1");
  other.set_group_id("g2");
  h.store->UpsertTaskGroup(other);
  auto misuse = ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE", "mgr-plan-1");
  misuse.set_group_id("g2");
  bool reused = false;
  try {
    h.coordinator->ReportStatus(misuse);
  } catch (const baton::util::DedupKeyReused&) {
    reused = true;
  }
  assert(reused);
  assert(h.store->GetTaskGroup("s1", "g2")->status() == v1::GROUP_STATUS_PENDING);
}

void TestLongCallerKeyStillDerives() {
  auto h = NewHarness();
  StartSession(h, "s1");

  const std::string key(250, 'r');
  const auto        first = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE", key));
  assert(first.result().tag() == v1::RESULT_TAG_OK);
  assert(first.decision().next_role() == v1::ROLE_IMPLEMENTER);

  const auto retry = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE", key));
  assert(retry.result().tag() == v1::RESULT_TAG_CONFLICT);
  assert(retry.decision().next_role() == first.decision().next_role());

  const auto decisions = Events(h, "routing_decision");
  assert(decisions.size() == 1);
  assert(decisions[0].dedup_key() == baton::util::DeriveDedupKey(key, "decision"));
  assert(decisions[0].dedup_key().size() <= baton::util::kMaxDedupKeyLength);

  // A key at the full caller limit works too.
  const std::string other(256, 'x');
  const auto        closed = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "FINISHED_MAYBE", other));
  assert(closed.decision().fail_closed());
}

void TestRetriedReviewReplaysOutcome() {
  auto h = NewHarness();
  StartSession(h, "s1");
  ReachReview(h);

  const auto first = h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "leak"), NewIssue(false, "naming")}, "rev-1"));
  const auto retry = h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "leak"), NewIssue(false, "naming")}, "rev-1"));

  assert(retry.result().tag() == v1::RESULT_TAG_CONFLICT);
  assert(retry.iteration() == first.iteration());
  assert(retry.review_status() == v1::GROUP_STATUS_CHANGES_REQUIRED);
  assert(retry.blocking_count() == 1);
  assert(retry.non_blocking_count() == 1);
  assert(retry.decision().next_role() == v1::ROLE_IMPLEMENTER);
  assert(h.store->GetTaskGroup("s1", "g1")->review_iteration() == 1);
  assert(Events(h, "issues_raised").size() == 1);
}

void TestStaleReportIsDroppedAndAudited() {
  auto h = NewHarness();
  StartSession(h, "s1");
  ReachReview(h);
  h.coordinator->RecordReview(ReviewRequest({}));
  assert(h.store->GetTaskGroup("s1", "g1")->status() == v1::GROUP_STATUS_APPROVED);

  const auto late = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_REVIEW", "late-1"));
  assert(late.decision().stale());
  assert(late.decision().group_status() == v1::GROUP_STATUS_APPROVED);
  assert(h.store->GetTaskGroup("s1", "g1")->status() == v1::GROUP_STATUS_APPROVED);

  const auto audits = Events(h, "audit");
  assert(audits.size() == 1);
  assert(audits[0].payload().audit().category() == "stale_report");
  assert(audits[0].dedup_key() == "late-1#stale");

  v1::RecordResponsesRequest responses;
  responses.set_session_id("s1");
  responses.set_group_id("g1");
  responses.set_responder(v1::ROLE_IMPLEMENTER);
  responses.set_iteration(1);
  const auto dropped = h.coordinator->RecordResponses(responses);
  assert(dropped.responses().empty());
  assert(dropped.result().message().find("stale report") != std::string::npos);
}

void TestUnknownStatusFailsClosed() {
  auto h = NewHarness();
  StartSession(h, "s1");
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));

  const auto response = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "FINISHED_MAYBE"));
  assert(response.decision().fail_closed());
  assert(response.decision().next_role() == v1::ROLE_MANAGER);

  const auto group = h.store->GetTaskGroup("s1", "g1");
  assert(group->status() == v1::GROUP_STATUS_IN_PROGRESS);
  assert(group->assigned_role() == v1::ROLE_MANAGER);
}

void TestInconsistentTransitionFailsClosed() {
  auto h = NewHarness();
  StartSession(h, "s1");
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));

  // A reviewer verdict on a group that never reached review.
  const auto response = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_REVIEWER, "APPROVED", "early-approval"));
  assert(response.decision().fail_closed());
  assert(response.decision().next_role() == v1::ROLE_MANAGER);
  assert(h.store->GetTaskGroup("s1", "g1")->status() == v1::GROUP_STATUS_IN_PROGRESS);

  const auto audits = Events(h, "audit");
  assert(audits.size() == 1);
  assert(audits[0].payload().audit().category() == "state_inconsistency");
  assert(audits[0].dedup_key() == "early-approval#inconsistency");
}

void TestEscalationRequests() {
  auto h = NewHarness();
  StartSession(h, "s1");
  ReachReview(h);

  v1::RequestEscalationRequest request;
  request.set_session_id("s1");
  request.set_group_id("g1");
  request.set_role(v1::ROLE_IMPLEMENTER);
  request.set_reason("cannot reproduce");

  // No review history yet: the request is inconsistent and goes to the manager.
  auto response = h.coordinator->RequestEscalation(request);
  assert(response.decision().fail_closed());
  assert(!response.decision().escalated());

  h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "flaky")}));
  response = h.coordinator->RequestEscalation(request);
  assert(response.decision().escalated());
  assert(response.decision().next_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(response.decision().reason() == "cannot reproduce");
  assert(h.store->GetTaskGroup("s1", "g1")->status() == v1::GROUP_STATUS_ESCALATED);
  assert(Events(h, "escalation").size() == 1);
}

void TestTimeouts() {
  auto h = NewHarness();
  StartSession(h, "s1");
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));

  v1::RecordTimeoutRequest request;
  request.set_session_id("s1");
  request.set_group_id("g1");
  request.set_role(v1::ROLE_IMPLEMENTER);
  request.set_deadline_ms(1000);
  request.set_dedup_key("timeout-1");

  const auto response = h.coordinator->RecordTimeout(request);
  assert(response.decision().action() == v1::TRANSITION_ACTION_RESPAWN);
  assert(response.decision().next_role() == v1::ROLE_IMPLEMENTER);
  assert(response.decision().status_code() == "TIMEOUT");
  assert(!response.progress().baseline());
  assert(response.progress().streak() == 1);
  assert(response.progress().attempts() == 1);
  assert(h.store->GetTaskGroup("s1", "g1")->attempts() == 1);
  assert(Events(h, "role_timeout").size() == 1);

  const auto retry = h.coordinator->RecordTimeout(request);
  assert(retry.result().tag() == v1::RESULT_TAG_CONFLICT);
  assert(retry.decision().action() == v1::TRANSITION_ACTION_RESPAWN);
  assert(Events(h, "role_timeout").size() == 1);
}

void TestRepeatedTimeoutsEscalate() {
  auto h = NewHarness();
  StartSession(h, "s1");
  ReachReview(h);
  const auto first = h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "leak")}));
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_REVIEW"));
  h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "leak", first.issues(0).issue_id())}));
  assert(h.store->GetTaskGroup("s1", "g1")->no_progress_count() == 1);

  v1::RecordTimeoutRequest request;
  request.set_session_id("s1");
  request.set_group_id("g1");
  request.set_role(v1::ROLE_IMPLEMENTER);

  auto response = h.coordinator->RecordTimeout(request);
  assert(response.progress().streak() == 2);
  assert(response.decision().action() == v1::TRANSITION_ACTION_RESPAWN);

  response = h.coordinator->RecordTimeout(request);
  assert(response.progress().escalate());
  assert(response.decision().escalated());
  assert(response.decision().next_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(h.store->GetTaskGroup("s1", "g1")->status() == v1::GROUP_STATUS_ESCALATED);
}

// Nobody ever reports: each timeout comes from whoever the last decision named.
void TestSilentGroupEscalatesThenTerminates() {
  auto h = NewHarness();
  StartSession(h, "s1");
  const auto planned = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));

  v1::RecordTimeoutRequest request;
  request.set_session_id("s1");
  request.set_group_id("g1");
  request.set_deadline_ms(1000);

  v1::Role                  next = planned.decision().next_role();
  v1::RecordTimeoutResponse response;
  int                       first_escalation = 0;
  int                       calls            = 0;
  while (calls < 20) {
    ++calls;
    request.set_role(next);
    response = h.coordinator->RecordTimeout(request);
    assert(!response.decision().stale());
    if (response.decision().escalated() && first_escalation == 0) {
      first_escalation = calls;
      assert(response.decision().next_role() == v1::ROLE_SENIOR_IMPLEMENTER);
    }
    if (response.decision().action() == v1::TRANSITION_ACTION_TERMINATE) break;
    next = response.decision().next_role();
  }

  assert(first_escalation == 3);
  assert(calls == 10);
  assert(response.progress().hard_cap());
  assert(response.progress().attempts() == 10);
  assert(response.decision().next_role() == v1::ROLE_MANAGER);

  const auto group = h.store->GetTaskGroup("s1", "g1");
  assert(group->status() == v1::GROUP_STATUS_ESCALATED);
  assert(group->assigned_role() == v1::ROLE_MANAGER);
  assert(group->attempts() == 10);
  assert(Events(h, "role_timeout").size() == 10);

  // The old assignee is now stale.
  request.set_role(next);
  assert(h.coordinator->RecordTimeout(request).decision().stale());
}

void TestReReviewDropsNewNotes() {
  auto h = NewHarness();
  StartSession(h, "s1");
  ReachReview(h);
  const auto first = h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "leak")}));
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_REVIEW"));

  const auto second =
      h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "leak", first.issues(0).issue_id()), NewIssue(false, "rename var")}));
  assert(second.dropped_size() == 1);
  assert(second.dropped(0).title() == "rename var");
  assert(second.non_blocking_count() == 0);
  assert(second.review_status() == v1::GROUP_STATUS_CHANGES_REQUIRED);
}

void TestRejectionRoundTripAndAutoAccept() {
  auto h = NewHarness();
  StartSession(h, "s1");
  ReachReview(h);
  const auto first = h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "wrong encoding")}));
  const auto id1   = first.issues(0).issue_id();

  v1::RecordResponsesRequest responses;
  responses.set_session_id("s1");
  responses.set_group_id("g1");
  responses.set_responder(v1::ROLE_IMPLEMENTER);
  responses.set_iteration(1);
  auto* answer = responses.add_responses();
  answer->set_issue_id(id1);
  answer->set_status(v1::RESPONSE_STATUS_REJECTED);
  answer->set_rationale("input is always ascii");
  h.coordinator->RecordResponses(responses);

  v1::ReviewRejectionsRequest verdict;
  verdict.set_session_id("s1");
  verdict.set_group_id("g1");
  verdict.set_reviewer(v1::ROLE_REVIEWER);
  verdict.set_iteration(1);
  verdict.add_accepted_issue_ids(id1);
  const auto settled = h.coordinator->ReviewRejections(verdict);
  assert(settled.responses(0).status() == v1::RESPONSE_STATUS_REJECTED_AND_ACCEPTED);

  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_REVIEW"));
  const auto second =
      h.coordinator->RecordReview(ReviewRequest({NewIssue(true, "Wrong Encoding"), NewIssue(true, "no test for utf-16")}));
  const auto id2 = second.issues(0).issue_id();
  assert(id2 != id1);
  assert(second.issues(0).rejection_accepted_at() == 1);
  assert(second.blocking_count() == 1);

  responses.set_iteration(2);
  responses.mutable_responses(0)->set_issue_id(id2);
  auto* fixed = responses.add_responses();
  fixed->set_issue_id(second.issues(1).issue_id());
  fixed->set_status(v1::RESPONSE_STATUS_FIXED);
  const auto again = h.coordinator->RecordResponses(responses);
  assert(again.auto_accepted_size() == 1);
  assert(again.auto_accepted(0) == id2);

  v1::CheckUnresolvedBlockingRequest check;
  check.set_session_id("s1");
  check.set_group_id("g1");
  assert(h.coordinator->CheckUnresolvedBlocking(check).unresolved().empty());
}

void TestFrozenWorkflowSurvivesLiveChanges() {
  auto h = NewHarness();
  StartSession(h, "s1");

  auto minimal = baton::workflow::DefaultWorkflowConfig();
  minimal.set_testing_mode(v1::TESTING_MODE_MINIMAL);
  h.coordinator->ReplaceWorkflow(minimal);
  StartSession(h, "s2");

  for (const auto* session : {"s1", "s2"}) {
    h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE", "", session));
  }
  const auto full = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_QA", "", "s1"));
  const auto fast = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_QA", "", "s2"));
  assert(full.decision().next_role() == v1::ROLE_QUALITY_CHECKER);
  assert(fast.decision().next_role() == v1::ROLE_REVIEWER);

  // A fresh coordinator over the same store reads the frozen snapshot back.
  auto restarted = NewHarness(h.store);
  auto back      = ReportRequest(v1::ROLE_QUALITY_CHECKER, "FAIL", "", "s2");
  back.add_markers("test_results");
  restarted.coordinator->ReportStatus(back);
  const auto again = restarted.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_QA", "", "s2"));
  assert(again.decision().next_role() == v1::ROLE_REVIEWER);
}

void TestFrozenWorkflowCannotBeOverwritten() {
  auto h = NewHarness();
  StartSession(h, "s1");

  auto minimal = baton::workflow::DefaultWorkflowConfig();
  minimal.set_testing_mode(v1::TESTING_MODE_MINIMAL);
  const auto state_type = std::string(baton::workflow::kWorkflowConfigStateType);
  assert(ThrowsValidation([&] { h.store->UpsertState("s1", "global", state_type, baton::store::ToJson(minimal)); }));

  auto restarted = NewHarness(h.store);
  restarted.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));
  const auto routed = restarted.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_QA"));
  assert(routed.decision().next_role() == v1::ROLE_QUALITY_CHECKER);
}

void TestRolledBackCreateLeavesNoCachedWorkflow() {
  auto h = NewHarness();

  bool aborted = false;
  try {
    h.store->Atomically("s1", [&](baton::store::AtomicUnit& unit) {
      unit.CreateSession("s1", v1::EXECUTION_MODE_SINGLE_TRACK, {});
      h.configs->Freeze(unit, "s1");
      throw std::runtime_error("abort create");
    });
  } catch (const std::runtime_error&) {
    aborted = true;
  }
  assert(aborted);
  assert(!h.store->GetSession("s1"));
  assert(h.configs->CachedSessions() == 0);

  // The workflow live at the real create is the one that sticks.
  auto minimal = baton::workflow::DefaultWorkflowConfig();
  minimal.set_testing_mode(v1::TESTING_MODE_MINIMAL);
  h.coordinator->ReplaceWorkflow(minimal);
  StartSession(h, "s1");
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "PLANNING_COMPLETE"));
  const auto routed = h.coordinator->ReportStatus(ReportRequest(v1::ROLE_IMPLEMENTER, "READY_FOR_QA"));
  assert(routed.decision().next_role() == v1::ROLE_REVIEWER);
  assert(h.configs->CachedSessions() == 1);

  // Completion drops the entry.
  h.coordinator->ReportStatus(ReportRequest(v1::ROLE_REVIEWER, "APPROVED"));
  v1::RecordScopeProgressRequest scope;
  scope.set_session_id("s1");
  scope.add_completed()->set_item_id("importer");
  h.coordinator->RecordScopeProgress(scope);
  v1::DeclareCompletionRequest declare;
  declare.set_session_id("s1");
  declare.set_role(v1::ROLE_MANAGER);
  assert(h.coordinator->DeclareCompletion(declare).verdict().accepted());
  assert(h.configs->CachedSessions() == 0);
}

void TestConfigCacheIsBounded() {
  auto store   = std::make_shared<CoordinationStore>(std::make_shared<baton::db::memory::MemoryRepository>());
  auto configs = std::make_shared<baton::workflow::SessionConfigCache>(baton::workflow::DefaultWorkflowConfig(), 2);
  for (const auto* session : {"a", "b", "c"}) {
    store->Atomically(session, [&](baton::store::AtomicUnit& unit) {
      unit.CreateSession(session, v1::EXECUTION_MODE_SINGLE_TRACK, {});
      configs->Freeze(unit, session);
    });
    store->Read([&](baton::store::AtomicUnit& unit) { return configs->Load(unit, session); });
  }
  assert(configs->CachedSessions() == 2);
}

void TestRequestValidation() {
  auto h = NewHarness();
  StartSession(h, "s1");

  auto by_implementer = ReviewRequest({});
  by_implementer.set_reviewer(v1::ROLE_IMPLEMENTER);
  assert(ThrowsValidation([&] { h.coordinator->RecordReview(by_implementer); }));

  v1::DeclareCompletionRequest declare;
  declare.set_session_id("s1");
  declare.set_role(v1::ROLE_REVIEWER);
  assert(ThrowsValidation([&] { h.coordinator->DeclareCompletion(declare); }));

  assert(ThrowsValidation([&] { h.coordinator->ReportStatus(ReportRequest(v1::ROLE_UNSPECIFIED, "CONTINUE")); }));
  assert(ThrowsValidation([&] { h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "")); }));

  v1::RecordScopeProgressRequest scope;
  scope.set_session_id("s1");
  assert(ThrowsValidation([&] { h.coordinator->RecordScopeProgress(scope); }));
  scope.add_completed()->set_item_id("not-in-scope");
  assert(ThrowsValidation([&] { h.coordinator->RecordScopeProgress(scope); }));

  scope.mutable_completed(0)->set_item_id("importer");
  scope.set_dedup_key("scope-1");
  assert(h.coordinator->RecordScopeProgress(scope).result().tag() == v1::RESULT_TAG_OK);
  assert(h.coordinator->RecordScopeProgress(scope).result().tag() == v1::RESULT_TAG_CONFLICT);
  assert(Events(h, "scope_item_completed").size() == 1);

  bool missing = false;
  try {
    h.coordinator->ReportStatus(ReportRequest(v1::ROLE_MANAGER, "CONTINUE", "", "nobody"));
  } catch (const baton::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

} // namespace

int main() {
  TestDuplicateSessionIsTaggedConflict();
  TestRetriedReportReplaysDecision();
  TestLongCallerKeyStillDerives();
  TestRetriedReviewReplaysOutcome();
  TestStaleReportIsDroppedAndAudited();
  TestUnknownStatusFailsClosed();
  TestInconsistentTransitionFailsClosed();
  TestEscalationRequests();
  TestTimeouts();
  TestRepeatedTimeoutsEscalate();
  TestSilentGroupEscalatesThenTerminates();
  TestReReviewDropsNewNotes();
  TestRejectionRoundTripAndAutoAccept();
  TestFrozenWorkflowSurvivesLiveChanges();
  TestFrozenWorkflowCannotBeOverwritten();
  TestRolledBackCreateLeavesNoCachedWorkflow();
  TestConfigCacheIsBounded();
  TestRequestValidation();

  std::cout << "baton_unit_coordinator_guards: pass\n";
  return 0;
}
