#include "issue_ledger.hpp"

#include <cctype>
#include <map>
#include <set>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/store/event_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifiers.hpp"

namespace baton::ledger {

namespace v1 = baton::coordination::v1;

namespace {

std::string Normalize(const std::string& text) {
  std::string out;
  bool        pending_space = false;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

const v1::Issue* FindIssue(const v1::IssuesRaised& raised, const std::string& issue_id) {
  for (const auto& issue : raised.issues()) {
    if (issue.issue_id() == issue_id) return &issue;
  }
  return nullptr;
}

bool IsImplementerAnswer(v1::ResponseStatus status) {
  return status == v1::RESPONSE_STATUS_FIXED || status == v1::RESPONSE_STATUS_REJECTED || status == v1::RESPONSE_STATUS_DEFERRED;
}

void Tally(const v1::Issue& issue, IssueCounts& counts) {
  if (issue.rejection_accepted_at() > 0) return;
  if (issue.blocking()) {
    ++counts.blocking;
  } else {
    ++counts.non_blocking;
  }
}

} // namespace

std::string Fingerprint(const v1::Issue& issue) {
  return Normalize(issue.location()) + "|" + Normalize(issue.title());
}

bool IsResolved(v1::ResponseStatus status) {
  return status == v1::RESPONSE_STATUS_FIXED || status == v1::RESPONSE_STATUS_REJECTED_AND_ACCEPTED;
}

IssueCounts CountIssues(const google::protobuf::RepeatedPtrField<v1::Issue>& issues) {
  IssueCounts counts;
  for (const auto& issue : issues) Tally(issue, counts);
  return counts;
}

IssueLedger::IssueLedger(store::AtomicUnit& unit) : unit_(unit) {
}

std::map<std::string, uint32_t> IssueLedger::AcceptedRejections(const std::string& session_id, const std::string& group_id,
                                                                const std::vector<v1::IssuesRaised>& history, uint32_t iteration) {
  std::map<std::string, uint32_t> accepted;
  for (const auto& earlier : history) {
    if (earlier.iteration() >= iteration) continue;
    auto responses = LatestResponses(session_id, group_id, earlier.iteration());
    if (!responses) continue;
    for (const auto& response : responses->responses()) {
      if (response.status() != v1::RESPONSE_STATUS_REJECTED_AND_ACCEPTED) continue;
      if (const auto* issue = FindIssue(earlier, response.issue_id()); issue && issue->blocking()) {
        accepted.emplace(Fingerprint(*issue), earlier.iteration());
      }
    }
  }
  return accepted;
}

std::vector<v1::IssuesRaised> IssueLedger::AllIssuesRaised(const std::string& session_id, const std::string& group_id) {
  store::EventFilter filter;
  filter.session_id = session_id;
  filter.group_id   = group_id;
  filter.event_type = std::string(store::event_type::kIssuesRaised);

  std::vector<v1::IssuesRaised> out;
  for (const auto& event : unit_.GetEvents(filter)) {
    out.push_back(event.payload().issues_raised());
  }
  return out;
}

ReviewRecord IssueLedger::RecordReview(const std::string& session_id, const std::string& group_id, v1::Role reviewer,
                                       uint32_t iteration, const google::protobuf::RepeatedPtrField<v1::Issue>& issues,
                                       const std::string& dedup_key) {
  if (iteration == 0) {
    throw util::ValidationError("review iteration starts at 1");
  }

  const auto history = AllIssuesRaised(session_id, group_id);
  if (!history.empty() && history.back().iteration() >= iteration) {
    throw util::ValidationError("iteration " + std::to_string(iteration) + " of " + group_id + " already reviewed");
  }

  std::map<std::string, v1::Issue> known;
  for (const auto& raised : history) {
    for (const auto& issue : raised.issues()) {
      known[issue.issue_id()] = issue;
    }
  }
  const auto accepted = AcceptedRejections(session_id, group_id, history, iteration);

  ReviewRecord record;
  record.iteration = iteration;
  record.re_review = iteration > 1;

  std::set<std::string> seen;
  uint32_t              sequence = 0;
  for (const auto& input : issues) {
    if (input.title().empty()) {
      throw util::ValidationError("issue title must not be empty");
    }

    v1::Issue issue = input;
    issue.clear_rejection_accepted_at();
    if (!issue.issue_id().empty()) {
      auto original = known.find(issue.issue_id());
      if (original == known.end()) {
        throw util::ValidationError("carried-over issue " + issue.issue_id() + " was never raised for " + group_id);
      }
      if (Fingerprint(issue) != Fingerprint(original->second) || issue.blocking() != original->second.blocking()) {
        throw util::ValidationError("carried-over issue " + issue.issue_id() + " does not match what was raised as " +
                                    issue.issue_id() + "; raise changed findings as new issues");
      }
    } else if (record.re_review && !issue.blocking()) {
      BATON_LOG_WARN("re-review dropped new non-blocking issue",
                     {observability::StringField("session_id", session_id), observability::StringField("group_id", group_id),
                      observability::IntField("iteration", iteration), observability::StringField("title", issue.title())});
      record.dropped.push_back(std::move(issue));
      continue;
    } else {
      issue.set_issue_id(util::MakeIssueId(group_id, iteration, ++sequence));
    }

    if (!seen.insert(issue.issue_id()).second) {
      throw util::ValidationError("issue " + issue.issue_id() + " listed twice");
    }
    if (issue.blocking()) {
      if (auto match = accepted.find(Fingerprint(issue)); match != accepted.end()) {
        issue.set_rejection_accepted_at(match->second);
      }
    }
    record.issues.push_back(std::move(issue));
  }

  IssueCounts counts;
  for (const auto& issue : record.issues) Tally(issue, counts);
  record.blocking_count     = counts.blocking;
  record.non_blocking_count = counts.non_blocking;

  for (const auto& issue : record.issues) {
    if (issue.rejection_accepted_at() == 0) continue;
    BATON_LOG_INFO("re-raised issue already settled by an accepted rejection",
                   {observability::StringField("session_id", session_id), observability::StringField("group_id", group_id),
                    observability::StringField("issue_id", issue.issue_id()),
                    observability::IntField("accepted_at", issue.rejection_accepted_at())});
  }

  v1::EventPayload payload;
  auto*            raised = payload.mutable_issues_raised();
  raised->set_iteration(iteration);
  raised->set_reviewer(reviewer);
  raised->set_re_review(record.re_review);
  for (const auto& issue : record.issues) {
    *raised->add_issues() = issue;
  }
  unit_.Append(session_id, group_id, payload, dedup_key);

  return record;
}

std::optional<v1::IssuesRaised> IssueLedger::LatestIssuesRaised(const std::string& session_id, const std::string& group_id) {
  auto event = unit_.LatestEvent(session_id, group_id, store::event_type::kIssuesRaised);
  if (!event) return std::nullopt;
  return event->payload().issues_raised();
}

std::optional<v1::IssueResponses> IssueLedger::LatestResponses(const std::string& session_id, const std::string& group_id,
                                                               uint32_t iteration) {
  store::EventFilter filter;
  filter.session_id = session_id;
  filter.group_id   = group_id;
  filter.event_type = std::string(store::event_type::kIssueResponses);

  const auto events = unit_.GetEvents(filter);
  for (auto it = events.rbegin(); it != events.rend(); ++it) {
    if (it->payload().issue_responses().iteration() == iteration) {
      return it->payload().issue_responses();
    }
  }
  return std::nullopt;
}

std::vector<v1::UnresolvedIssue> IssueLedger::UnresolvedBlocking(const std::string& session_id, const std::string& group_id) {
  std::vector<v1::UnresolvedIssue> out;

  auto raised = LatestIssuesRaised(session_id, group_id);
  if (!raised) return out;

  std::unordered_map<std::string, v1::ResponseStatus> status_by_id;
  if (auto responses = LatestResponses(session_id, group_id, raised->iteration())) {
    for (const auto& response : responses->responses()) {
      status_by_id[response.issue_id()] = response.status();
    }
  }

  for (const auto& issue : raised->issues()) {
    if (!issue.blocking() || issue.rejection_accepted_at() > 0) continue;
    auto it = status_by_id.find(issue.issue_id());
    if (it != status_by_id.end() && IsResolved(it->second)) continue;

    v1::UnresolvedIssue unresolved;
    unresolved.set_group_id(group_id);
    unresolved.set_iteration(raised->iteration());
    *unresolved.mutable_issue() = issue;
    out.push_back(std::move(unresolved));
  }
  return out;
}

ResponsesRecord IssueLedger::RecordResponses(const std::string& session_id, const std::string& group_id, v1::Role responder,
                                             uint32_t iteration, const google::protobuf::RepeatedPtrField<v1::IssueResponse>& responses,
                                             const std::string& dedup_key) {
  const auto history = AllIssuesRaised(session_id, group_id);
  if (history.empty() || history.back().iteration() != iteration) {
    throw util::ValidationError("responses for " + group_id + " must target the latest review iteration");
  }
  const auto& raised = history.back();

  const auto accepted_fingerprints = AcceptedRejections(session_id, group_id, history, iteration);

  ResponsesRecord       record;
  std::set<std::string> seen;
  for (const auto& input : responses) {
    const auto* issue = FindIssue(raised, input.issue_id());
    if (!issue) {
      throw util::ValidationError("issue " + input.issue_id() + " is not part of iteration " + std::to_string(iteration));
    }
    if (!seen.insert(input.issue_id()).second) {
      throw util::ValidationError("issue " + input.issue_id() + " answered twice");
    }
    if (!IsImplementerAnswer(input.status())) {
      throw util::ValidationError("implementers answer FIXED, REJECTED or DEFERRED, got " + v1::ResponseStatus_Name(input.status()));
    }

    v1::IssueResponse response = input;
    if (response.status() == v1::RESPONSE_STATUS_REJECTED && issue->blocking()) {
      auto match = accepted_fingerprints.find(Fingerprint(*issue));
      if (match != accepted_fingerprints.end()) {
        response.set_status(v1::RESPONSE_STATUS_REJECTED_AND_ACCEPTED);
        response.set_rationale(response.rationale() + " [auto-accepted: identical rejection accepted at iteration " +
                               std::to_string(match->second) + "]");
        record.auto_accepted.push_back(response.issue_id());
      }
    }
    record.responses.push_back(std::move(response));
  }

  v1::EventPayload payload;
  auto*            body = payload.mutable_issue_responses();
  body->set_iteration(iteration);
  body->set_responder(responder);
  for (const auto& response : record.responses) {
    *body->add_responses() = response;
  }
  unit_.Append(session_id, group_id, payload, dedup_key);

  for (const auto& issue_id : record.auto_accepted) {
    BATON_LOG_WARN("re-raised issue rejected again; auto-accepted",
                   {observability::StringField("session_id", session_id), observability::StringField("group_id", group_id),
                    observability::StringField("issue_id", issue_id)});

    v1::EventPayload audit;
    audit.mutable_audit()->set_category("re_rejection_auto_accepted");
    audit.mutable_audit()->set_message("issue " + issue_id + " matches a rejection already accepted; manager attention advised");
    unit_.Append(session_id, group_id, audit, util::DeriveDedupKey(dedup_key, "auto-accept#" + issue_id));
  }

  return record;
}

std::vector<v1::IssueResponse> IssueLedger::ReviewRejections(const std::string& session_id, const std::string& group_id,
                                                             v1::Role reviewer, uint32_t iteration,
                                                             const std::vector<std::string>& accepted_ids,
                                                             const std::vector<std::string>& overruled_ids,
                                                             const std::string&              dedup_key) {
  if (accepted_ids.empty() && overruled_ids.empty()) {
    throw util::ValidationError("rejection review names no issues");
  }

  auto latest = LatestResponses(session_id, group_id, iteration);
  if (!latest) {
    throw util::ValidationError("no responses recorded for " + group_id + " iteration " + std::to_string(iteration));
  }

  std::unordered_map<std::string, int> index;
  for (int i = 0; i < latest->responses_size(); ++i) {
    index.emplace(latest->responses(i).issue_id(), i);
  }

  std::set<std::string> touched;
  auto                  settle = [&](const std::string& issue_id, v1::ResponseStatus status) {
    auto it = index.find(issue_id);
    if (it == index.end()) {
      throw util::ValidationError("issue " + issue_id + " has no response in iteration " + std::to_string(iteration));
    }
    if (!touched.insert(issue_id).second) {
      throw util::ValidationError("issue " + issue_id + " named twice in rejection review");
    }
    auto* response = latest->mutable_responses(it->second);
    if (response->status() != v1::RESPONSE_STATUS_REJECTED) {
      throw util::ValidationError("issue " + issue_id + " is not awaiting a rejection review");
    }
    response->set_status(status);
  };

  for (const auto& id : accepted_ids) settle(id, v1::RESPONSE_STATUS_REJECTED_AND_ACCEPTED);
  for (const auto& id : overruled_ids) settle(id, v1::RESPONSE_STATUS_REJECTION_OVERRULED);

  latest->set_responder(reviewer);

  v1::EventPayload payload;
  *payload.mutable_issue_responses() = *latest;
  unit_.Append(session_id, group_id, payload, dedup_key);

  return {latest->responses().begin(), latest->responses().end()};
}

} // namespace baton::ledger
