#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/validation/validator_gate.hpp"

namespace {

namespace v1 = baton::coordination::v1;
using baton::store::AtomicUnit;
using baton::store::CoordinationStore;
using baton::validation::ValidatorGate;

std::shared_ptr<CoordinationStore> NewSession() {
  auto store = std::make_shared<CoordinationStore>(std::make_shared<baton::db::memory::MemoryRepository>());

  v1::ScopeDescriptor scope;
  for (const auto* id : {"login", "logout", "audit"}) {
    auto* item = scope.add_items();
    item->set_item_id(id);
    item->set_description(std::string("implement ") + id);
  }
  store->CreateSession("s1", v1::EXECUTION_MODE_SINGLE_TRACK, scope);
  return store;
}

void MoveGroup(CoordinationStore& store, const std::string& group_id, std::initializer_list<v1::GroupStatus> path) {
  store.Atomically("s1", [&](AtomicUnit& unit) {
    v1::TaskGroup group;
    group.set_session_id("s1");
    group.set_group_id(group_id);
    group.set_name(group_id);
    if (auto existing = unit.GetTaskGroup("s1", group_id)) group = *existing;
    for (auto status : path) {
      group.set_status(status);
      group = unit.UpsertTaskGroup(group);
    }
  });
}

void Complete(CoordinationStore& store, const std::string& item_id) {
  v1::EventPayload payload;
  payload.mutable_scope_item_completed()->set_item_id(item_id);
  store.AppendEvent("s1", "", "scope_item_completed", payload, "done:" + item_id);
}

v1::ValidatorVerdict Evaluate(CoordinationStore& store) {
  return store.Read([](AtomicUnit& unit) { return ValidatorGate(unit).Evaluate(unit.RequireSession("s1")); });
}

int CountKind(const v1::ValidatorVerdict& verdict, std::string_view kind) {
  int count = 0;
  for (const auto& missing : verdict.missing()) {
    if (missing.kind() == kind) ++count;
  }
  return count;
}

void TestEmptySessionReportsEveryGap() {
  auto       store   = NewSession();
  const auto verdict = Evaluate(*store);

  assert(!verdict.accepted());
  assert(verdict.route_to() == v1::ROLE_MANAGER);
  assert(CountKind(verdict, baton::validation::missing_kind::kScopeItem) == 3);
  assert(CountKind(verdict, baton::validation::missing_kind::kMissingSignoff) == 1);
  assert(verdict.missing(0).detail() == "not completed: implement login");
}

void TestScopeChangeSettlesRemovedItems() {
  auto store = NewSession();
  Complete(*store, "login");
  Complete(*store, "logout");

  v1::EventPayload change;
  change.mutable_scope_change()->add_removed_item_ids("audit");
  change.mutable_scope_change()->set_reason("deferred to next release");
  change.mutable_scope_change()->set_approved_by(v1::ROLE_MANAGER);
  store->AppendEvent("s1", "", "scope_change", change, "change:1");

  MoveGroup(*store, "g1", {v1::GROUP_STATUS_IN_PROGRESS, v1::GROUP_STATUS_READY_FOR_REVIEW, v1::GROUP_STATUS_APPROVED});

  const auto verdict = Evaluate(*store);
  assert(verdict.accepted());
  assert(verdict.missing().empty());
  assert(verdict.route_to() == v1::ROLE_UNSPECIFIED);
}

void TestUnsignedGroupsAndOpenIssuesBlockAcceptance() {
  auto store = NewSession();
  for (const auto* id : {"login", "logout", "audit"}) Complete(*store, id);

  MoveGroup(*store, "g1", {v1::GROUP_STATUS_IN_PROGRESS, v1::GROUP_STATUS_READY_FOR_REVIEW, v1::GROUP_STATUS_APPROVED_WITH_NOTES});
  MoveGroup(*store, "g2", {v1::GROUP_STATUS_IN_PROGRESS, v1::GROUP_STATUS_READY_FOR_REVIEW, v1::GROUP_STATUS_CHANGES_REQUIRED});

  v1::EventPayload raised;
  raised.mutable_issues_raised()->set_iteration(1);
  raised.mutable_issues_raised()->set_reviewer(v1::ROLE_REVIEWER);
  auto* issue = raised.mutable_issues_raised()->add_issues();
  issue->set_issue_id("g2-1-1");
  issue->set_blocking(true);
  issue->set_title("unchecked input");
  store->AppendEvent("s1", "g2", "issues_raised", raised, "review:g2:1");

  const auto verdict = Evaluate(*store);
  assert(!verdict.accepted());
  assert(verdict.missing_size() == 2);
  assert(verdict.missing(0).kind() == baton::validation::missing_kind::kUnresolvedIssue);
  assert(verdict.missing(0).group_id() == "g2");
  assert(verdict.missing(0).item_id() == "g2-1-1");
  assert(verdict.missing(1).kind() == baton::validation::missing_kind::kMissingSignoff);
  assert(verdict.missing(1).group_id() == "g2");
}

} // namespace

int main() {
  TestEmptySessionReportsEveryGap();
  TestScopeChangeSettlesRemovedItems();
  TestUnsignedGroupsAndOpenIssuesBlockAcceptance();

  std::cout << "baton_unit_validator_gate: pass\n";
  return 0;
}
