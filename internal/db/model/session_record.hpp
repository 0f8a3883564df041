#pragma once

#include <cstdint>
#include <string>

#include "baton/coordination/v1.hpp"

namespace baton::db::model {

/*
  Persistent session row.

  The original scope is stored as the JSON form of ScopeDescriptor and is
  never rewritten after creation.
*/
struct SessionRecord {
  std::string session_id;

  baton::coordination::v1::SessionStatus status = baton::coordination::v1::SESSION_STATUS_ACTIVE;

  baton::coordination::v1::ExecutionMode mode = baton::coordination::v1::EXECUTION_MODE_SINGLE_TRACK;

  std::string scope_json;

  uint64_t created_at_ms = 0;

  // 0 while the session is open
  uint64_t closed_at_ms = 0;
};

}
