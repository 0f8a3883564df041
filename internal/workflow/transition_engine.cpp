#include "transition_engine.hpp"

#include <algorithm>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace baton::workflow {

namespace v1 = baton::coordination::v1;

namespace {

bool HasMarker(const std::vector<std::string>& markers, const std::string& marker) {
  return std::find(markers.begin(), markers.end(), marker) != markers.end();
}

bool BlocksProgressVerdict(v1::GroupStatus set_status) {
  return model::IsSignedOff(set_status) || set_status == v1::GROUP_STATUS_REJECTED;
}

v1::Role EffectiveImplementer(const v1::TaskGroup& group) {
  return model::IsImplementationRole(group.implementer_role()) ? group.implementer_role() : v1::ROLE_IMPLEMENTER;
}

void RequireEdge(const v1::TaskGroup& group, v1::GroupStatus to, bool via_review) {
  const bool allowed = via_review ? model::CanTransitionViaReview(group.status(), to) : model::CanTransition(group.status(), to);
  if (!allowed) {
    throw util::StateInconsistency("group " + group.group_id() + " cannot move from " + v1::GroupStatus_Name(group.status()) +
                                   " to " + v1::GroupStatus_Name(to));
  }
}

TransitionOutcome Begin(const v1::TaskGroup& group, v1::Role reporter, const std::string& status_code) {
  TransitionOutcome outcome;
  outcome.group = group;
  outcome.decision.set_current_role(reporter);
  outcome.decision.set_status_code(status_code);
  outcome.decision.set_group_id(group.group_id());
  return outcome;
}

void Finish(TransitionOutcome& outcome, v1::Role next, v1::TransitionAction action, const std::string& reason) {
  outcome.group.set_assigned_role(next);
  outcome.decision.set_next_role(next);
  outcome.decision.set_action(action);
  outcome.decision.set_group_status(outcome.group.status());
  outcome.decision.set_reason(reason);
}

} // namespace

TransitionEngine::TransitionEngine(std::shared_ptr<const SessionConfig> config) : config_(std::move(config)) {
}

TransitionOutcome TransitionEngine::Route(const TransitionInput& input) const {
  const auto& group = input.group;

  const auto* rule = config_->FindRule(input.role, input.status_code);
  if (!rule) {
    return FailClosed(group, input.role, input.status_code,
                      "unknown status code " + input.status_code + " for " + v1::Role_Name(input.role));
  }

  if (input.check_capabilities) {
    if (const auto* caps = config_->Capabilities(input.role)) {
      for (const auto& marker : caps->mandatory()) {
        if (!HasMarker(input.markers, marker)) {
          return FailClosed(group, input.role, input.status_code, "missing mandatory capability marker " + marker);
        }
      }
    }
  }

  auto        outcome = Begin(group, input.role, input.status_code);
  v1::Role    next    = rule->next_role();
  std::string reason  = "table";

  if (next == v1::ROLE_IMPLEMENTER) {
    next = EffectiveImplementer(group);
  }

  if (config_->testing_mode() != v1::TESTING_MODE_FULL && next == v1::ROLE_QUALITY_CHECKER) {
    next   = v1::ROLE_REVIEWER;
    reason = "quality check skipped (" + v1::TestingMode_Name(config_->testing_mode()) + ")";
  }

  if (input.role == v1::ROLE_IMPLEMENTER && next == v1::ROLE_IMPLEMENTER && config_->IsSecuritySensitive(group.name())) {
    next   = v1::ROLE_SENIOR_IMPLEMENTER;
    reason = "security sensitive group";
  }

  if (next == v1::ROLE_SENIOR_IMPLEMENTER) {
    outcome.group.set_implementer_role(v1::ROLE_SENIOR_IMPLEMENTER);
  }

  if (rule->set_status() != v1::GROUP_STATUS_UNSPECIFIED) {
    RequireEdge(group, rule->set_status(), model::IsReviewRole(input.role));
    outcome.group.set_status(rule->set_status());
  }

  *outcome.decision.mutable_context_to_carry() = rule->context_to_carry();
  Finish(outcome, next, rule->action(), reason);
  outcome.dispatch_pending = rule->dispatch_pending();
  outcome.check_phase      = rule->check_phase();

  if (input.progress && (input.progress->escalate || input.progress->hard_cap) && !BlocksProgressVerdict(rule->set_status())) {
    return ApplyProgress(outcome.group, input.role, input.status_code, *input.progress);
  }
  return outcome;
}

TransitionOutcome TransitionEngine::ApplyProgress(const v1::TaskGroup& group, v1::Role reporter, const std::string& status_code,
                                                  const progress::ProgressVerdict& verdict) const {
  if (verdict.hard_cap) {
    auto capped = Begin(group, reporter, status_code);
    RequireEdge(group, v1::GROUP_STATUS_ESCALATED, false);
    capped.group.set_status(v1::GROUP_STATUS_ESCALATED);

    const std::string reason = "hard cap reached after " + std::to_string(verdict.attempts) + " attempts";
    Finish(capped, v1::ROLE_MANAGER, v1::TRANSITION_ACTION_TERMINATE, reason);
    capped.decision.set_escalated(true);

    v1::EscalationRecorded record;
    record.set_from_role(EffectiveImplementer(group));
    record.set_to_role(v1::ROLE_MANAGER);
    record.set_reason(reason);
    record.set_streak(verdict.streak);
    record.set_iteration(verdict.iteration);
    capped.escalation = std::move(record);
    return capped;
  }

  return EscalateFrom(group, reporter, status_code, "no progress for " + std::to_string(verdict.streak) + " consecutive iterations",
                      verdict.streak);
}

TransitionOutcome TransitionEngine::EscalateFrom(const v1::TaskGroup& group, v1::Role reporter, const std::string& status_code,
                                                 const std::string& reason, uint32_t streak) const {
  auto outcome = Begin(group, reporter, status_code);

  const v1::Role from   = EffectiveImplementer(group);
  const v1::Role target = config_->EscalationTarget(from);

  RequireEdge(group, v1::GROUP_STATUS_ESCALATED, false);
  outcome.group.set_status(v1::GROUP_STATUS_ESCALATED);

  v1::Role             next   = v1::ROLE_MANAGER;
  v1::TransitionAction action = v1::TRANSITION_ACTION_TERMINATE;
  if (target != v1::ROLE_UNSPECIFIED && target != v1::ROLE_MANAGER) {
    next   = target;
    action = v1::TRANSITION_ACTION_ROUTE;
    if (model::IsImplementationRole(target)) {
      outcome.group.set_implementer_role(target);
    }
  }

  Finish(outcome, next, action, reason);
  outcome.decision.set_escalated(true);

  v1::EscalationRecorded record;
  record.set_from_role(from);
  record.set_to_role(next);
  record.set_reason(reason);
  record.set_streak(streak);
  record.set_iteration(group.review_iteration());
  outcome.escalation = std::move(record);
  return outcome;
}

TransitionOutcome TransitionEngine::FailClosed(const v1::TaskGroup& group, v1::Role reporter, const std::string& status_code,
                                               const std::string& reason) const {
  auto outcome = Begin(group, reporter, status_code);
  Finish(outcome, v1::ROLE_MANAGER, v1::TRANSITION_ACTION_ROUTE, reason);
  outcome.decision.set_fail_closed(true);
  return outcome;
}

TransitionOutcome TransitionEngine::Respawn(const v1::TaskGroup& group, v1::Role role, const std::string& status_code,
                                            const std::string& reason) const {
  auto outcome = Begin(group, role, status_code);
  Finish(outcome, role, v1::TRANSITION_ACTION_RESPAWN, reason);
  return outcome;
}

std::string ReviewStatusCode(v1::GroupStatus review_status) {
  switch (review_status) {
    case v1::GROUP_STATUS_CHANGES_REQUIRED:
      return "CHANGES_REQUESTED";
    case v1::GROUP_STATUS_APPROVED_WITH_NOTES:
      return "APPROVED_WITH_NOTES";
    case v1::GROUP_STATUS_APPROVED:
      return "APPROVED";
    default:
      throw util::ValidationError("not a review verdict: " + v1::GroupStatus_Name(review_status));
  }
}

v1::GroupStatus DecideReview(uint32_t blocking_count, uint32_t non_blocking_count) {
  if (blocking_count > 0) return v1::GROUP_STATUS_CHANGES_REQUIRED;
  if (non_blocking_count > 0) return v1::GROUP_STATUS_APPROVED_WITH_NOTES;
  return v1::GROUP_STATUS_APPROVED;
}

} // namespace baton::workflow
