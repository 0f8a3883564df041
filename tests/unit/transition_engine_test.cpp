#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/workflow/session_config.hpp"
#include "internal/workflow/transition_engine.hpp"

namespace {

namespace v1 = baton::coordination::v1;
using baton::workflow::TransitionEngine;
using baton::workflow::TransitionInput;

TransitionEngine Engine(v1::TestingMode mode = v1::TESTING_MODE_FULL) {
  auto config = baton::workflow::DefaultWorkflowConfig();
  config.set_testing_mode(mode);
  return TransitionEngine(std::make_shared<const baton::workflow::SessionConfig>(config));
}

v1::TaskGroup Group(v1::GroupStatus status, const std::string& name = "parser") {
  v1::TaskGroup group;
  group.set_session_id("s1");
  group.set_group_id("g1");
  group.set_name(name);
  group.set_status(status);
  group.set_implementer_role(v1::ROLE_IMPLEMENTER);
  group.set_review_iteration(2);
  return group;
}

TransitionInput Report(v1::Role role, const std::string& code, const v1::TaskGroup& group) {
  TransitionInput input;
  input.role        = role;
  input.status_code = code;
  input.markers     = {"status", "test_results"};
  input.group       = group;
  return input;
}

baton::progress::ProgressVerdict Verdict(bool escalate, bool hard_cap) {
  baton::progress::ProgressVerdict verdict;
  verdict.iteration = 4;
  verdict.streak    = 3;
  verdict.escalate  = escalate;
  verdict.hard_cap  = hard_cap;
  return verdict;
}

void TestTableRouteCarriesContext() {
  auto       engine  = Engine();
  const auto outcome = engine.Route(Report(v1::ROLE_MANAGER, "PLANNING_COMPLETE", Group(v1::GROUP_STATUS_PENDING)));

  assert(outcome.decision.next_role() == v1::ROLE_IMPLEMENTER);
  assert(outcome.decision.action() == v1::TRANSITION_ACTION_ROUTE);
  assert(outcome.decision.group_status() == v1::GROUP_STATUS_IN_PROGRESS);
  assert(outcome.decision.context_to_carry_size() == 2);
  assert(outcome.decision.context_to_carry(0) == "plan");
  assert(!outcome.decision.fail_closed());
  assert(outcome.group.status() == v1::GROUP_STATUS_IN_PROGRESS);
  assert(outcome.group.assigned_role() == v1::ROLE_IMPLEMENTER);
  assert(!outcome.escalation);
}

void TestUnknownCodeFailsClosed() {
  auto       engine  = Engine();
  const auto outcome = engine.Route(Report(v1::ROLE_IMPLEMENTER, "DONE_I_GUESS", Group(v1::GROUP_STATUS_IN_PROGRESS)));

  assert(outcome.decision.fail_closed());
  assert(outcome.decision.next_role() == v1::ROLE_MANAGER);
  assert(outcome.decision.action() == v1::TRANSITION_ACTION_ROUTE);
  assert(outcome.decision.reason().find("DONE_I_GUESS") != std::string::npos);
  assert(outcome.group.status() == v1::GROUP_STATUS_IN_PROGRESS);
}

void TestMissingMandatoryMarkerFailsClosed() {
  auto engine = Engine();
  auto input  = Report(v1::ROLE_QUALITY_CHECKER, "PASS", Group(v1::GROUP_STATUS_READY_FOR_REVIEW));
  input.markers = {"status"};

  const auto outcome = engine.Route(input);
  assert(outcome.decision.fail_closed());
  assert(outcome.decision.reason().find("test_results") != std::string::npos);

  input.check_capabilities = false;
  assert(!engine.Route(input).decision.fail_closed());
}

void TestEscalatedImplementerIsSticky() {
  auto engine = Engine();
  auto group  = Group(v1::GROUP_STATUS_READY_FOR_REVIEW);
  group.set_implementer_role(v1::ROLE_SENIOR_IMPLEMENTER);

  const auto outcome = engine.Route(Report(v1::ROLE_QUALITY_CHECKER, "FAIL", group));
  assert(outcome.decision.next_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(outcome.group.status() == v1::GROUP_STATUS_CHANGES_REQUIRED);
}

void TestTestingModeSkipsQualityCheck() {
  const auto full = Engine(v1::TESTING_MODE_FULL).Route(Report(v1::ROLE_IMPLEMENTER, "READY_FOR_QA", Group(v1::GROUP_STATUS_IN_PROGRESS)));
  assert(full.decision.next_role() == v1::ROLE_QUALITY_CHECKER);

  const auto minimal =
      Engine(v1::TESTING_MODE_MINIMAL).Route(Report(v1::ROLE_IMPLEMENTER, "READY_FOR_QA", Group(v1::GROUP_STATUS_IN_PROGRESS)));
  assert(minimal.decision.next_role() == v1::ROLE_REVIEWER);
  assert(minimal.decision.reason().find("quality check skipped") != std::string::npos);
}

void TestSecuritySensitiveGroupsGetTheSeniorImplementer() {
  auto       engine  = Engine();
  const auto outcome = engine.Route(Report(v1::ROLE_IMPLEMENTER, "PARTIAL", Group(v1::GROUP_STATUS_IN_PROGRESS, "Auth token refresh")));

  assert(outcome.decision.next_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(outcome.decision.action() == v1::TRANSITION_ACTION_RESPAWN);
  assert(outcome.group.implementer_role() == v1::ROLE_SENIOR_IMPLEMENTER);

  const auto plain = engine.Route(Report(v1::ROLE_IMPLEMENTER, "PARTIAL", Group(v1::GROUP_STATUS_IN_PROGRESS, "csv parser")));
  assert(plain.decision.next_role() == v1::ROLE_IMPLEMENTER);
}

void TestReviewVerdictFromReadyForReview() {
  auto       engine  = Engine();
  auto       input   = Report(v1::ROLE_REVIEWER, "APPROVED", Group(v1::GROUP_STATUS_READY_FOR_REVIEW));
  const auto outcome = engine.Route(input);
  assert(outcome.group.status() == v1::GROUP_STATUS_APPROVED);
  assert(outcome.decision.next_role() == v1::ROLE_MANAGER);
}

void TestForbiddenEdgeIsInconsistency() {
  auto engine = Engine();
  bool threw  = false;
  try {
    engine.Route(Report(v1::ROLE_REVIEWER, "APPROVED", Group(v1::GROUP_STATUS_IN_PROGRESS)));
  } catch (const baton::util::StateInconsistency&) {
    threw = true;
  }
  assert(threw);
}

void TestNoProgressEscalatesOneTier() {
  auto engine = Engine();
  auto input  = Report(v1::ROLE_REVIEWER, "CHANGES_REQUESTED", Group(v1::GROUP_STATUS_READY_FOR_REVIEW));
  input.progress = Verdict(true, false);

  const auto outcome = engine.Route(input);
  assert(outcome.decision.escalated());
  assert(outcome.decision.next_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(outcome.decision.action() == v1::TRANSITION_ACTION_ROUTE);
  assert(outcome.group.status() == v1::GROUP_STATUS_ESCALATED);
  assert(outcome.group.implementer_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(outcome.group.assigned_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(outcome.escalation);
  assert(outcome.escalation->from_role() == v1::ROLE_IMPLEMENTER);
  assert(outcome.escalation->streak() == 3);
}

void TestSeniorEscalatesToLeadReviewer() {
  auto engine = Engine();
  auto group  = Group(v1::GROUP_STATUS_CHANGES_REQUIRED);
  group.set_implementer_role(v1::ROLE_SENIOR_IMPLEMENTER);

  const auto outcome = engine.EscalateFrom(group, v1::ROLE_SENIOR_IMPLEMENTER, "ESCALATION_REQUESTED", "stuck", 1);
  assert(outcome.decision.next_role() == v1::ROLE_LEAD_REVIEWER);
  assert(outcome.group.implementer_role() == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(outcome.escalation->to_role() == v1::ROLE_LEAD_REVIEWER);
}

void TestHardCapTerminatesAtManager() {
  auto engine = Engine();
  auto input  = Report(v1::ROLE_REVIEWER, "CHANGES_REQUESTED", Group(v1::GROUP_STATUS_READY_FOR_REVIEW));
  input.progress = Verdict(true, true);

  const auto outcome = engine.Route(input);
  assert(outcome.decision.next_role() == v1::ROLE_MANAGER);
  assert(outcome.decision.action() == v1::TRANSITION_ACTION_TERMINATE);
  assert(outcome.group.status() == v1::GROUP_STATUS_ESCALATED);
  assert(outcome.escalation->to_role() == v1::ROLE_MANAGER);
}

void TestApprovalIgnoresProgressVerdict() {
  auto engine = Engine();
  auto input  = Report(v1::ROLE_REVIEWER, "APPROVED", Group(v1::GROUP_STATUS_READY_FOR_REVIEW));
  input.progress = Verdict(true, true);

  const auto outcome = engine.Route(input);
  assert(!outcome.decision.escalated());
  assert(outcome.group.status() == v1::GROUP_STATUS_APPROVED);
}

void TestRespawnKeepsRoleAndStatus() {
  auto       engine  = Engine();
  const auto outcome = engine.Respawn(Group(v1::GROUP_STATUS_IN_PROGRESS), v1::ROLE_IMPLEMENTER, "TIMEOUT", "deadline passed");
  assert(outcome.decision.next_role() == v1::ROLE_IMPLEMENTER);
  assert(outcome.decision.action() == v1::TRANSITION_ACTION_RESPAWN);
  assert(outcome.group.status() == v1::GROUP_STATUS_IN_PROGRESS);
}

void TestReviewDecision() {
  using baton::workflow::DecideReview;
  assert(DecideReview(1, 4) == v1::GROUP_STATUS_CHANGES_REQUIRED);
  assert(DecideReview(0, 2) == v1::GROUP_STATUS_APPROVED_WITH_NOTES);
  assert(DecideReview(0, 0) == v1::GROUP_STATUS_APPROVED);

  assert(baton::workflow::ReviewStatusCode(v1::GROUP_STATUS_CHANGES_REQUIRED) == "CHANGES_REQUESTED");
  bool threw = false;
  try {
    baton::workflow::ReviewStatusCode(v1::GROUP_STATUS_PENDING);
  } catch (const baton::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRoutingRuleFlagsReachTheOutcome() {
  auto engine = Engine();

  auto planned = engine.Route(Report(v1::ROLE_MANAGER, "PLANNING_COMPLETE", Group(v1::GROUP_STATUS_PENDING)));
  assert(planned.dispatch_pending);
  assert(!planned.check_phase);

  auto approved = engine.Route(Report(v1::ROLE_REVIEWER, "APPROVED", Group(v1::GROUP_STATUS_READY_FOR_REVIEW)));
  assert(approved.check_phase);
  assert(!approved.dispatch_pending);

  const auto* rule = engine.Config().DispatchRule();
  assert(rule != nullptr);
  assert(rule->current_role() == v1::ROLE_MANAGER);
  assert(rule->status_code() == "PLANNING_COMPLETE");
  assert(engine.Config().max_parallel() == 4);
}

void TestOnlyOneRuleMayDispatch() {
  auto config = baton::workflow::DefaultWorkflowConfig();
  for (auto& rule : *config.mutable_transitions()) {
    if (rule.current_role() == v1::ROLE_MANAGER && rule.status_code() == "CONTINUE") rule.set_dispatch_pending(true);
  }

  bool threw = false;
  try {
    baton::workflow::SessionConfig session_config(config);
  } catch (const baton::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  config = baton::workflow::DefaultWorkflowConfig();
  for (auto& rule : *config.mutable_transitions()) {
    if (rule.current_role() == v1::ROLE_REVIEWER && rule.status_code() == "APPROVED") rule.set_dispatch_pending(true);
  }
  for (auto& rule : *config.mutable_transitions()) {
    if (rule.dispatch_pending() && rule.current_role() == v1::ROLE_MANAGER) rule.set_dispatch_pending(false);
  }
  threw = false;
  try {
    baton::workflow::SessionConfig session_config(config);
  } catch (const baton::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTableRouteCarriesContext();
  TestUnknownCodeFailsClosed();
  TestMissingMandatoryMarkerFailsClosed();
  TestEscalatedImplementerIsSticky();
  TestTestingModeSkipsQualityCheck();
  TestSecuritySensitiveGroupsGetTheSeniorImplementer();
  TestReviewVerdictFromReadyForReview();
  TestForbiddenEdgeIsInconsistency();
  TestNoProgressEscalatesOneTier();
  TestSeniorEscalatesToLeadReviewer();
  TestHardCapTerminatesAtManager();
  TestApprovalIgnoresProgressVerdict();
  TestRespawnKeepsRoleAndStatus();
  TestReviewDecision();
  TestRoutingRuleFlagsReachTheOutcome();
  TestOnlyOneRuleMayDispatch();

  std::cout << "baton_unit_transition_engine: pass\n";
  return 0;
}
