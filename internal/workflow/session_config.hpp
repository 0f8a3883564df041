#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "baton/coordination/v1.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/util/identifiers.hpp"

namespace baton::store {
class AtomicUnit;
}

namespace baton::workflow {

// State snapshot (scope "global") holding the frozen workflow of a session.
inline constexpr std::string_view kWorkflowConfigStateType = util::kWorkflowConfigStateType;

baton::coordination::v1::WorkflowConfig DefaultWorkflowConfig();

// Fills omitted parts (empty lists, zero limits, unspecified testing mode) from the default.
baton::coordination::v1::WorkflowConfig NormalizeWorkflowConfig(baton::coordination::v1::WorkflowConfig config);

// Throws ValidationError on incomplete rules, duplicate (role, status) keys or escalation self-loops.
void ValidateWorkflowConfig(const baton::coordination::v1::WorkflowConfig& config);

/*
  SessionConfig

  Immutable, indexed view of one session's workflow. Shared between
  threads through shared_ptr<const SessionConfig>.
*/
class SessionConfig {
 public:
  explicit SessionConfig(baton::coordination::v1::WorkflowConfig config);

  // nullptr when the table has no entry.
  const baton::coordination::v1::TransitionRule* FindRule(baton::coordination::v1::Role role, const std::string& status_code) const;

  // nullptr when the role declares no capabilities.
  const baton::coordination::v1::RoleCapabilities* Capabilities(baton::coordination::v1::Role role) const;

  // ROLE_UNSPECIFIED when the chain ends at this role.
  baton::coordination::v1::Role EscalationTarget(baton::coordination::v1::Role role) const;

  progress::ProgressLimits Limits() const;

  // The rule PENDING groups are routed through when handed out; nullptr if none dispatches.
  const baton::coordination::v1::TransitionRule* DispatchRule() const;

  uint32_t max_parallel() const {
    return config_.max_parallel();
  }

  baton::coordination::v1::TestingMode testing_mode() const {
    return config_.testing_mode();
  }

  // Case-insensitive keyword match against the group name.
  bool IsSecuritySensitive(std::string_view group_name) const;

  const baton::coordination::v1::WorkflowConfig& Proto() const {
    return config_;
  }

 private:
  baton::coordination::v1::WorkflowConfig config_;

  std::map<std::pair<int, std::string>, int> rule_index_;
  std::map<int, int>                          capability_index_;
  std::map<int, baton::coordination::v1::Role> escalation_;
  int                                           dispatch_rule_ = -1;
};

/*
  SessionConfigCache

  Freezes the live workflow into a session at creation (persisted as the
  global "workflow_config" snapshot) and serves it back afterwards. The
  live workflow may be replaced at any time; only sessions created later
  see the new one.

  Only snapshots read back by Load are cached, never the one Freeze is
  still writing. At most `capacity` sessions are kept.
*/
class SessionConfigCache {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit SessionConfigCache(baton::coordination::v1::WorkflowConfig live, std::size_t capacity = kDefaultCapacity);

  std::shared_ptr<const SessionConfig> Freeze(store::AtomicUnit& unit, const std::string& session_id);

  // Falls back to the built-in default (with a warning) when no snapshot exists.
  std::shared_ptr<const SessionConfig> Load(store::AtomicUnit& unit, const std::string& session_id);

  void ReplaceLive(baton::coordination::v1::WorkflowConfig live);

  // Drops the cached entry; the next Load reads the snapshot again.
  void Forget(const std::string& session_id);

  std::size_t CachedSessions();

 private:
  std::shared_ptr<const SessionConfig> Live();
  void                                 Remember(const std::string& session_id, std::shared_ptr<const SessionConfig> config);

  std::mutex                                                             mutex_;
  std::size_t                                                            capacity_;
  std::shared_ptr<const SessionConfig>                                   live_;
  std::unordered_map<std::string, std::shared_ptr<const SessionConfig>> by_session_;
};

} // namespace baton::workflow
