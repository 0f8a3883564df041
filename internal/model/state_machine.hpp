#pragma once

#include "baton/coordination/v1/types.pb.h"

namespace baton::model {

using baton::coordination::v1::GroupStatus;
using baton::coordination::v1::Role;

constexpr bool IsTerminal(GroupStatus status) {
  return status == coordination::v1::GROUP_STATUS_APPROVED || status == coordination::v1::GROUP_STATUS_REJECTED;
}

constexpr bool IsSignedOff(GroupStatus status) {
  return status == coordination::v1::GROUP_STATUS_APPROVED || status == coordination::v1::GROUP_STATUS_APPROVED_WITH_NOTES;
}

/*
  Task group status graph. Self-edges are always allowed; terminal states
  have no outgoing edges.
*/
constexpr bool CanTransition(GroupStatus from, GroupStatus to) {
  using namespace baton::coordination::v1;

  if (from == to) {
    return true;
  }
  if (IsTerminal(from) || to == GROUP_STATUS_UNSPECIFIED || to == GROUP_STATUS_PENDING) {
    return false;
  }
  if (to == GROUP_STATUS_REJECTED) {
    return true;
  }

  switch (from) {
    case GROUP_STATUS_PENDING:
      return to == GROUP_STATUS_IN_PROGRESS || to == GROUP_STATUS_ESCALATED;
    case GROUP_STATUS_IN_PROGRESS:
      return to == GROUP_STATUS_READY_FOR_REVIEW || to == GROUP_STATUS_ESCALATED;
    case GROUP_STATUS_READY_FOR_REVIEW:
      return to == GROUP_STATUS_UNDER_REVIEW || to == GROUP_STATUS_CHANGES_REQUIRED || to == GROUP_STATUS_IN_PROGRESS ||
             to == GROUP_STATUS_ESCALATED;
    case GROUP_STATUS_UNDER_REVIEW:
      return to == GROUP_STATUS_APPROVED || to == GROUP_STATUS_APPROVED_WITH_NOTES || to == GROUP_STATUS_CHANGES_REQUIRED ||
             to == GROUP_STATUS_ESCALATED;
    case GROUP_STATUS_CHANGES_REQUIRED:
      return to == GROUP_STATUS_IN_PROGRESS || to == GROUP_STATUS_READY_FOR_REVIEW || to == GROUP_STATUS_ESCALATED;
    case GROUP_STATUS_APPROVED_WITH_NOTES:
      return to == GROUP_STATUS_APPROVED;
    case GROUP_STATUS_ESCALATED:
      return to == GROUP_STATUS_IN_PROGRESS || to == GROUP_STATUS_READY_FOR_REVIEW;
    default:
      return false;
  }
}

// Review verdicts reported straight from ReadyForReview pass through UnderReview.
constexpr bool CanTransitionViaReview(GroupStatus from, GroupStatus to) {
  return CanTransition(from, to) ||
         (from == coordination::v1::GROUP_STATUS_READY_FOR_REVIEW && CanTransition(coordination::v1::GROUP_STATUS_UNDER_REVIEW, to));
}

constexpr bool IsImplementationRole(Role role) {
  return role == coordination::v1::ROLE_IMPLEMENTER || role == coordination::v1::ROLE_SENIOR_IMPLEMENTER;
}

constexpr bool IsReviewRole(Role role) {
  return role == coordination::v1::ROLE_REVIEWER || role == coordination::v1::ROLE_LEAD_REVIEWER;
}

} // namespace baton::model
