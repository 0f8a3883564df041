#include "session_config.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/store/event_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifiers.hpp"

namespace baton::workflow {

namespace v1 = baton::coordination::v1;

namespace {

constexpr uint32_t kDefaultMaxIterations     = 3;
constexpr uint32_t kDefaultHardCapIterations = 10;
constexpr uint32_t kDefaultMaxParallel       = 4;

v1::TransitionRule* AddRule(v1::WorkflowConfig* config, v1::Role from, const char* status_code, v1::Role to, v1::TransitionAction action,
             v1::GroupStatus set_status, std::initializer_list<const char*> context = {}) {
  auto* rule = config->add_transitions();
  rule->set_current_role(from);
  rule->set_status_code(status_code);
  rule->set_next_role(to);
  rule->set_action(action);
  rule->set_set_status(set_status);
  for (const char* item : context) {
    rule->add_context_to_carry(item);
  }
  return rule;
}

void AddCapabilities(v1::WorkflowConfig* config, v1::Role role, std::initializer_list<const char*> mandatory,
                     std::initializer_list<const char*> optional) {
  auto* caps = config->add_capabilities();
  caps->set_role(role);
  for (const char* marker : mandatory) caps->add_mandatory(marker);
  for (const char* marker : optional) caps->add_optional(marker);
}

void AddEscalation(v1::WorkflowConfig* config, v1::Role from, v1::Role to) {
  auto* edge = config->add_escalation();
  edge->set_from_role(from);
  edge->set_to_role(to);
}

void AddImplementationRules(v1::WorkflowConfig* config, v1::Role role) {
  AddRule(config, role, "READY_FOR_QA", v1::ROLE_QUALITY_CHECKER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_READY_FOR_REVIEW,
          {"implementation_summary", "files_changed"});
  AddRule(config, role, "READY_FOR_REVIEW", v1::ROLE_REVIEWER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_READY_FOR_REVIEW,
          {"implementation_summary", "files_changed"});
  AddRule(config, role, "PARTIAL", role, v1::TRANSITION_ACTION_RESPAWN, v1::GROUP_STATUS_IN_PROGRESS, {"progress_notes"});
  AddRule(config, role, "BLOCKED", v1::ROLE_LEAD_REVIEWER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_UNSPECIFIED, {"blocker"});
}

void AddReviewRules(v1::WorkflowConfig* config, v1::Role role) {
  AddRule(config, role, "APPROVED", v1::ROLE_MANAGER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_APPROVED)->set_check_phase(true);
  AddRule(config, role, "APPROVED_WITH_NOTES", v1::ROLE_MANAGER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_APPROVED_WITH_NOTES,
          {"notes"})
      ->set_check_phase(true);
  AddRule(config, role, "CHANGES_REQUESTED", v1::ROLE_IMPLEMENTER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_CHANGES_REQUIRED,
          {"issues", "reviewer_feedback"});
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

v1::WorkflowConfig DefaultWorkflowConfig() {
  v1::WorkflowConfig config;
  config.set_max_iterations(kDefaultMaxIterations);
  config.set_hard_cap_iterations(kDefaultHardCapIterations);
  config.set_max_parallel(kDefaultMaxParallel);
  config.set_testing_mode(v1::TESTING_MODE_FULL);
  config.add_security_keywords("security");
  config.add_security_keywords("auth");

  AddEscalation(&config, v1::ROLE_IMPLEMENTER, v1::ROLE_SENIOR_IMPLEMENTER);
  AddEscalation(&config, v1::ROLE_SENIOR_IMPLEMENTER, v1::ROLE_LEAD_REVIEWER);
  AddEscalation(&config, v1::ROLE_LEAD_REVIEWER, v1::ROLE_MANAGER);

  AddCapabilities(&config, v1::ROLE_IMPLEMENTER, {"status"}, {"files_changed", "tests_added"});
  AddCapabilities(&config, v1::ROLE_SENIOR_IMPLEMENTER, {"status"}, {"files_changed", "root_cause"});
  AddCapabilities(&config, v1::ROLE_QUALITY_CHECKER, {"status", "test_results"}, {"coverage"});
  AddCapabilities(&config, v1::ROLE_REVIEWER, {"status"}, {"issues"});
  AddCapabilities(&config, v1::ROLE_LEAD_REVIEWER, {"status"}, {"issues", "guidance"});
  AddCapabilities(&config, v1::ROLE_MANAGER, {"status"}, {"plan"});

  AddRule(&config, v1::ROLE_MANAGER, "PLANNING_COMPLETE", v1::ROLE_IMPLEMENTER, v1::TRANSITION_ACTION_ROUTE,
          v1::GROUP_STATUS_IN_PROGRESS, {"plan", "scope"})
      ->set_dispatch_pending(true);
  AddRule(&config, v1::ROLE_MANAGER, "CONTINUE", v1::ROLE_IMPLEMENTER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_IN_PROGRESS);
  AddRule(&config, v1::ROLE_MANAGER, "REJECT_GROUP", v1::ROLE_MANAGER, v1::TRANSITION_ACTION_TERMINATE, v1::GROUP_STATUS_REJECTED);
  AddRule(&config, v1::ROLE_MANAGER, "COMPLETE", v1::ROLE_MANAGER, v1::TRANSITION_ACTION_TERMINATE, v1::GROUP_STATUS_UNSPECIFIED);

  AddImplementationRules(&config, v1::ROLE_IMPLEMENTER);
  AddImplementationRules(&config, v1::ROLE_SENIOR_IMPLEMENTER);

  AddRule(&config, v1::ROLE_QUALITY_CHECKER, "PASS", v1::ROLE_REVIEWER, v1::TRANSITION_ACTION_ROUTE, v1::GROUP_STATUS_UNSPECIFIED,
          {"test_results"});
  AddRule(&config, v1::ROLE_QUALITY_CHECKER, "FAIL", v1::ROLE_IMPLEMENTER, v1::TRANSITION_ACTION_ROUTE,
          v1::GROUP_STATUS_CHANGES_REQUIRED, {"test_failures"});
  AddRule(&config, v1::ROLE_QUALITY_CHECKER, "FAIL_ESCALATE", v1::ROLE_SENIOR_IMPLEMENTER, v1::TRANSITION_ACTION_ROUTE,
          v1::GROUP_STATUS_CHANGES_REQUIRED, {"test_failures"});

  AddReviewRules(&config, v1::ROLE_REVIEWER);
  AddReviewRules(&config, v1::ROLE_LEAD_REVIEWER);
  AddRule(&config, v1::ROLE_LEAD_REVIEWER, "UNBLOCKING_GUIDANCE", v1::ROLE_IMPLEMENTER, v1::TRANSITION_ACTION_RESPAWN,
          v1::GROUP_STATUS_IN_PROGRESS, {"guidance"});

  return config;
}

v1::WorkflowConfig NormalizeWorkflowConfig(v1::WorkflowConfig config) {
  const auto defaults = DefaultWorkflowConfig();

  if (config.transitions().empty()) *config.mutable_transitions() = defaults.transitions();
  if (config.capabilities().empty()) *config.mutable_capabilities() = defaults.capabilities();
  if (config.escalation().empty()) *config.mutable_escalation() = defaults.escalation();
  if (config.security_keywords().empty()) *config.mutable_security_keywords() = defaults.security_keywords();
  if (config.max_iterations() == 0) config.set_max_iterations(defaults.max_iterations());
  if (config.hard_cap_iterations() == 0) config.set_hard_cap_iterations(defaults.hard_cap_iterations());
  if (config.max_parallel() == 0) config.set_max_parallel(defaults.max_parallel());
  if (config.testing_mode() == v1::TESTING_MODE_UNSPECIFIED) config.set_testing_mode(defaults.testing_mode());

  return config;
}

void ValidateWorkflowConfig(const v1::WorkflowConfig& config) {
  std::set<std::pair<int, std::string>> seen;
  int                                   dispatching = 0;
  for (const auto& rule : config.transitions()) {
    const std::string where = v1::Role_Name(rule.current_role()) + "/" + rule.status_code();
    if (rule.current_role() == v1::ROLE_UNSPECIFIED || rule.status_code().empty()) {
      throw util::ValidationError("transition rule needs current_role and status_code: " + where);
    }
    if (rule.next_role() == v1::ROLE_UNSPECIFIED || rule.action() == v1::TRANSITION_ACTION_UNSPECIFIED) {
      throw util::ValidationError("transition rule needs next_role and action: " + where);
    }
    if (!seen.emplace(rule.current_role(), rule.status_code()).second) {
      throw util::ValidationError("duplicate transition rule: " + where);
    }
    if (rule.dispatch_pending()) {
      if (rule.set_status() != v1::GROUP_STATUS_IN_PROGRESS) {
        throw util::ValidationError("a dispatching rule must move groups to GROUP_STATUS_IN_PROGRESS: " + where);
      }
      if (++dispatching > 1) {
        throw util::ValidationError("more than one transition rule dispatches pending groups: " + where);
      }
    }
  }

  std::set<int> seen_caps;
  for (const auto& caps : config.capabilities()) {
    if (caps.role() == v1::ROLE_UNSPECIFIED || !seen_caps.insert(caps.role()).second) {
      throw util::ValidationError("capabilities declared twice or without a role: " + v1::Role_Name(caps.role()));
    }
  }

  std::set<int> seen_edges;
  for (const auto& edge : config.escalation()) {
    if (edge.from_role() == v1::ROLE_UNSPECIFIED || edge.to_role() == v1::ROLE_UNSPECIFIED) {
      throw util::ValidationError("escalation edge needs both roles");
    }
    if (edge.from_role() == edge.to_role()) {
      throw util::ValidationError("escalation edge may not loop on " + v1::Role_Name(edge.from_role()));
    }
    if (!seen_edges.insert(edge.from_role()).second) {
      throw util::ValidationError("escalation declared twice for " + v1::Role_Name(edge.from_role()));
    }
  }

  if (config.max_iterations() == 0 || config.hard_cap_iterations() == 0) {
    throw util::ValidationError("iteration limits must be positive");
  }
}

// ------------------------------------------------------------------
// SessionConfig
// ------------------------------------------------------------------

SessionConfig::SessionConfig(v1::WorkflowConfig config) : config_(NormalizeWorkflowConfig(std::move(config))) {
  ValidateWorkflowConfig(config_);

  for (int i = 0; i < config_.transitions_size(); ++i) {
    const auto& rule = config_.transitions(i);
    rule_index_.emplace(std::make_pair(static_cast<int>(rule.current_role()), rule.status_code()), i);
    if (rule.dispatch_pending()) dispatch_rule_ = i;
  }
  for (int i = 0; i < config_.capabilities_size(); ++i) {
    capability_index_.emplace(config_.capabilities(i).role(), i);
  }
  for (const auto& edge : config_.escalation()) {
    escalation_.emplace(edge.from_role(), edge.to_role());
  }
}

const v1::TransitionRule* SessionConfig::FindRule(v1::Role role, const std::string& status_code) const {
  auto it = rule_index_.find({static_cast<int>(role), status_code});
  if (it == rule_index_.end()) return nullptr;
  return &config_.transitions(it->second);
}

const v1::RoleCapabilities* SessionConfig::Capabilities(v1::Role role) const {
  auto it = capability_index_.find(role);
  if (it == capability_index_.end()) return nullptr;
  return &config_.capabilities(it->second);
}

v1::Role SessionConfig::EscalationTarget(v1::Role role) const {
  auto it = escalation_.find(role);
  if (it == escalation_.end()) return v1::ROLE_UNSPECIFIED;
  return it->second;
}

progress::ProgressLimits SessionConfig::Limits() const {
  return {config_.max_iterations(), config_.hard_cap_iterations()};
}

const v1::TransitionRule* SessionConfig::DispatchRule() const {
  if (dispatch_rule_ < 0) return nullptr;
  return &config_.transitions(dispatch_rule_);
}

bool SessionConfig::IsSecuritySensitive(std::string_view group_name) const {
  const auto name = Lower(group_name);
  for (const auto& keyword : config_.security_keywords()) {
    if (!keyword.empty() && name.find(Lower(keyword)) != std::string::npos) return true;
  }
  return false;
}

// ------------------------------------------------------------------
// SessionConfigCache
// ------------------------------------------------------------------

SessionConfigCache::SessionConfigCache(v1::WorkflowConfig live, std::size_t capacity)
    : capacity_(capacity), live_(std::make_shared<const SessionConfig>(std::move(live))) {
}

void SessionConfigCache::ReplaceLive(v1::WorkflowConfig live) {
  auto next = std::make_shared<const SessionConfig>(std::move(live));
  std::lock_guard<std::mutex> lock(mutex_);
  live_ = std::move(next);
}

std::shared_ptr<const SessionConfig> SessionConfigCache::Live() {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_;
}

void SessionConfigCache::Remember(const std::string& session_id, std::shared_ptr<const SessionConfig> config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capacity_ == 0) return;
  if (by_session_.size() >= capacity_ && by_session_.find(session_id) == by_session_.end()) {
    by_session_.erase(by_session_.begin());
  }
  by_session_[session_id] = std::move(config);
}

void SessionConfigCache::Forget(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  by_session_.erase(session_id);
}

std::size_t SessionConfigCache::CachedSessions() {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_session_.size();
}

std::shared_ptr<const SessionConfig> SessionConfigCache::Freeze(store::AtomicUnit& unit, const std::string& session_id) {
  const std::string state_type(kWorkflowConfigStateType);
  if (unit.GetState(session_id, std::string(util::kGlobalScope), state_type).found) {
    return Load(unit, session_id);
  }

  auto config = Live();
  unit.UpsertState(session_id, std::string(util::kGlobalScope), state_type, store::ToJson(config->Proto()));
  return config;
}

std::shared_ptr<const SessionConfig> SessionConfigCache::Load(store::AtomicUnit& unit, const std::string& session_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = by_session_.find(session_id);
    if (it != by_session_.end()) return it->second;
  }

  const auto snapshot = unit.GetState(session_id, std::string(util::kGlobalScope), std::string(kWorkflowConfigStateType));
  if (!snapshot.found) {
    BATON_LOG_WARN("session has no frozen workflow; using built-in default", {observability::StringField("session_id", session_id)});
    return std::make_shared<const SessionConfig>(DefaultWorkflowConfig());
  }

  v1::WorkflowConfig proto;
  try {
    store::FromJson(snapshot.payload_json, &proto);
  } catch (const util::ValidationError& e) {
    BATON_LOG_ERROR("frozen workflow unreadable; using built-in default",
                    {observability::StringField("session_id", session_id), observability::StringField("error", e.what())});
    return std::make_shared<const SessionConfig>(DefaultWorkflowConfig());
  }

  auto config = std::make_shared<const SessionConfig>(std::move(proto));
  Remember(session_id, config);
  return config;
}

} // namespace baton::workflow
