#pragma once

#include <cstdint>
#include <string>

#include "baton/coordination/v1.hpp"

namespace baton::db::model {

struct TaskGroupRecord {
  std::string session_id;
  std::string group_id;
  std::string name;

  baton::coordination::v1::GroupStatus status = baton::coordination::v1::GROUP_STATUS_PENDING;

  baton::coordination::v1::Role assigned_role = baton::coordination::v1::ROLE_UNSPECIFIED;

  // Implementation tier currently owning the work; raised by escalation.
  baton::coordination::v1::Role implementer_role = baton::coordination::v1::ROLE_IMPLEMENTER;

  uint32_t review_iteration      = 0;
  uint32_t no_progress_count     = 0;
  uint32_t blocking_issues_count = 0;
  uint32_t complexity            = 0;
  uint32_t attempts              = 0;

  uint64_t updated_at_ms = 0;
};

}
