#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "baton/coordination/v1.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/workflow/session_config.hpp"

namespace baton::workflow {

struct TransitionInput {
  baton::coordination::v1::Role      role = baton::coordination::v1::ROLE_UNSPECIFIED;
  std::string                        status_code;
  std::vector<std::string>           markers;
  baton::coordination::v1::TaskGroup group;
  std::optional<progress::ProgressVerdict> progress;
  // Off for status codes the coordinator synthesizes itself (review verdicts).
  bool check_capabilities = true;
};

struct TransitionOutcome {
  baton::coordination::v1::RoutingDecision decision;
  // Group with status, assigned_role and implementer_role applied.
  baton::coordination::v1::TaskGroup group;
  std::optional<baton::coordination::v1::EscalationRecorded> escalation;
  // Copied from the table rule that routed the group.
  bool dispatch_pending = false;
  bool check_phase      = false;
};

/*
  TransitionEngine

  Pure routing over one session's frozen workflow. Never touches the
  store; the coordinator persists whatever it returns.

  Route() throws util::StateInconsistency when the table asks for a status
  edge the group graph does not allow.
*/
class TransitionEngine {
 public:
  explicit TransitionEngine(std::shared_ptr<const SessionConfig> config);

  TransitionOutcome Route(const TransitionInput& input) const;

  // hard_cap terminates at the manager; escalate goes one tier up. Both mark the group Escalated.
  TransitionOutcome ApplyProgress(const baton::coordination::v1::TaskGroup& group, baton::coordination::v1::Role reporter,
                                  const std::string& status_code, const progress::ProgressVerdict& verdict) const;

  // Next tier above the group's implementer; the top tier terminates at the manager.
  TransitionOutcome EscalateFrom(const baton::coordination::v1::TaskGroup& group, baton::coordination::v1::Role reporter,
                                 const std::string& status_code, const std::string& reason, uint32_t streak) const;

  // Routes to the manager and leaves the group status alone.
  TransitionOutcome FailClosed(const baton::coordination::v1::TaskGroup& group, baton::coordination::v1::Role reporter,
                               const std::string& status_code, const std::string& reason) const;

  // Same-role respawn used for timeouts that did not escalate.
  TransitionOutcome Respawn(const baton::coordination::v1::TaskGroup& group, baton::coordination::v1::Role role,
                            const std::string& status_code, const std::string& reason) const;

  const SessionConfig& Config() const {
    return *config_;
  }

 private:
  std::shared_ptr<const SessionConfig> config_;
};

// Status code a reviewing role's verdict maps to in the table.
std::string ReviewStatusCode(baton::coordination::v1::GroupStatus review_status);

// blocking > 0 => CHANGES_REQUIRED, else non-blocking > 0 => APPROVED_WITH_NOTES, else APPROVED.
baton::coordination::v1::GroupStatus DecideReview(uint32_t blocking_count, uint32_t non_blocking_count);

} // namespace baton::workflow
