#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "baton/coordination/v1.hpp"

namespace baton::store {
class AtomicUnit;
}

namespace baton::ledger {

struct ReviewRecord {
  uint32_t                                    iteration = 0;
  bool                                        re_review = false;
  std::vector<baton::coordination::v1::Issue> issues;
  // New non-blocking issues a re-review tried to add.
  std::vector<baton::coordination::v1::Issue> dropped;
  uint32_t                                    blocking_count     = 0;
  uint32_t                                    non_blocking_count = 0;
};

struct IssueCounts {
  uint32_t blocking     = 0;
  uint32_t non_blocking = 0;
};

struct ResponsesRecord {
  std::vector<baton::coordination::v1::IssueResponse> responses;
  std::vector<std::string>                            auto_accepted;
};

/*
  IssueLedger

  Event-sourced issue view for one task group at a time. Every review pass
  appends one full issues_raised event; every response pass (and every
  rejection review) appends one issue_responses event. Nothing is ever
  rewritten: the latest event of each kind wins.

  Works inside the caller's AtomicUnit; dedup keys are mandatory and
  derived keys ("<key>#...") are used for the audit events it emits.

  A blocking issue that matches one whose rejection was accepted in an
  earlier iteration is raised with rejection_accepted_at set and counts
  as neither blocking nor non-blocking.
*/
class IssueLedger {
 public:
  explicit IssueLedger(store::AtomicUnit& unit);

  ReviewRecord RecordReview(const std::string& session_id, const std::string& group_id, baton::coordination::v1::Role reviewer,
                            uint32_t iteration, const google::protobuf::RepeatedPtrField<baton::coordination::v1::Issue>& issues,
                            const std::string& dedup_key);

  std::optional<baton::coordination::v1::IssuesRaised> LatestIssuesRaised(const std::string& session_id, const std::string& group_id);

  std::optional<baton::coordination::v1::IssueResponses> LatestResponses(const std::string& session_id, const std::string& group_id,
                                                                         uint32_t iteration);

  // Blocking issues of the latest raise not marked FIXED or REJECTED_AND_ACCEPTED.
  std::vector<baton::coordination::v1::UnresolvedIssue> UnresolvedBlocking(const std::string& session_id, const std::string& group_id);

  // Responses must target the latest raise. A blocking issue whose identical
  // twin had its rejection accepted earlier is auto-accepted when rejected again.
  ResponsesRecord RecordResponses(const std::string& session_id, const std::string& group_id, baton::coordination::v1::Role responder,
                                  uint32_t                                                                  iteration,
                                  const google::protobuf::RepeatedPtrField<baton::coordination::v1::IssueResponse>& responses,
                                  const std::string&                                                        dedup_key);

  std::vector<baton::coordination::v1::IssueResponse> ReviewRejections(const std::string& session_id, const std::string& group_id,
                                                                       baton::coordination::v1::Role reviewer, uint32_t iteration,
                                                                       const std::vector<std::string>& accepted_ids,
                                                                       const std::vector<std::string>& overruled_ids,
                                                                       const std::string&              dedup_key);

 private:
  std::vector<baton::coordination::v1::IssuesRaised> AllIssuesRaised(const std::string& session_id, const std::string& group_id);

  // Fingerprint -> iteration of the accepted rejection, over raises before `iteration`.
  std::map<std::string, uint32_t> AcceptedRejections(const std::string& session_id, const std::string& group_id,
                                                     const std::vector<baton::coordination::v1::IssuesRaised>& history,
                                                     uint32_t                                                  iteration);

  store::AtomicUnit& unit_;
};

// Normalized "location|title": lowercase, trimmed, inner whitespace collapsed.
std::string Fingerprint(const baton::coordination::v1::Issue& issue);

bool IsResolved(baton::coordination::v1::ResponseStatus status);

IssueCounts CountIssues(const google::protobuf::RepeatedPtrField<baton::coordination::v1::Issue>& issues);

} // namespace baton::ledger
