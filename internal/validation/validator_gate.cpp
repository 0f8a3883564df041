#include "validator_gate.hpp"

#include <set>
#include <string>
#include <vector>

#include "internal/ledger/issue_ledger.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/store/event_codec.hpp"

namespace baton::validation {

namespace v1 = baton::coordination::v1;

namespace {

void AddMissing(v1::ValidatorVerdict& verdict, std::string_view kind, const std::string& group_id, const std::string& item_id,
                const std::string& detail) {
  auto* missing = verdict.add_missing();
  missing->set_kind(std::string(kind));
  missing->set_group_id(group_id);
  missing->set_item_id(item_id);
  missing->set_detail(detail);
}

std::vector<v1::Event> SessionEvents(store::AtomicUnit& unit, const std::string& session_id, std::string_view type) {
  store::EventFilter filter;
  filter.session_id = session_id;
  filter.event_type = std::string(type);
  return unit.GetEvents(filter);
}

} // namespace

ValidatorGate::ValidatorGate(store::AtomicUnit& unit) : unit_(unit) {
}

v1::ValidatorVerdict ValidatorGate::Evaluate(const v1::Session& session) {
  const auto& session_id = session.session_id();
  v1::ValidatorVerdict verdict;

  std::set<std::string> settled;
  for (const auto& event : SessionEvents(unit_, session_id, store::event_type::kScopeItemCompleted)) {
    settled.insert(event.payload().scope_item_completed().item_id());
  }
  for (const auto& event : SessionEvents(unit_, session_id, store::event_type::kScopeChange)) {
    for (const auto& removed : event.payload().scope_change().removed_item_ids()) {
      settled.insert(removed);
    }
  }
  for (const auto& item : session.original_scope().items()) {
    if (settled.count(item.item_id()) == 0) {
      AddMissing(verdict, missing_kind::kScopeItem, "", item.item_id(),
                 item.description().empty() ? "not completed" : "not completed: " + item.description());
    }
  }

  const auto groups = unit_.ListTaskGroups(session_id);

  ledger::IssueLedger ledger(unit_);
  for (const auto& group : groups) {
    for (const auto& unresolved : ledger.UnresolvedBlocking(session_id, group.group_id())) {
      AddMissing(verdict, missing_kind::kUnresolvedIssue, group.group_id(), unresolved.issue().issue_id(),
                 "blocking issue unresolved: " + unresolved.issue().title());
    }
  }

  if (groups.empty()) {
    AddMissing(verdict, missing_kind::kMissingSignoff, "", "", "session has no task groups");
  }
  for (const auto& group : groups) {
    if (!model::IsSignedOff(group.status())) {
      AddMissing(verdict, missing_kind::kMissingSignoff, group.group_id(), "",
                 "group status is " + v1::GroupStatus_Name(group.status()));
    }
  }

  verdict.set_accepted(verdict.missing().empty());
  verdict.set_route_to(verdict.accepted() ? v1::ROLE_UNSPECIFIED : v1::ROLE_MANAGER);
  return verdict;
}

} // namespace baton::validation
