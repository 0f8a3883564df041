#pragma once

#include <string_view>

#include "baton/coordination/v1.hpp"

namespace baton::store {
class AtomicUnit;
}

namespace baton::validation {

namespace missing_kind {
inline constexpr std::string_view kScopeItem       = "scope_item";
inline constexpr std::string_view kUnresolvedIssue = "unresolved_issue";
inline constexpr std::string_view kMissingSignoff  = "missing_signoff";
} // namespace missing_kind

/*
  ValidatorGate

  Final acceptance check for a session. Runs every check and reports every
  failure; it never stops at the first one. Recording the verdict and
  closing the session is the caller's job.

  Checks, in order:
    1. original scope items completed or removed by a scope change
    2. no unresolved blocking issue in any task group
    3. every task group signed off (and at least one exists)
*/
class ValidatorGate {
 public:
  explicit ValidatorGate(store::AtomicUnit& unit);

  baton::coordination::v1::ValidatorVerdict Evaluate(const baton::coordination::v1::Session& session);

 private:
  store::AtomicUnit& unit_;
};

} // namespace baton::validation
