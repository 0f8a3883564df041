#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace baton::util {

/*
  Identifier rules shared by the store and the workflow surface.

  Every Validate* throws ValidationError on empty, over-length or
  out-of-charset input. Nothing malformed reaches a repository.
*/

inline constexpr std::size_t kMaxSessionIdLength = 128;
inline constexpr std::size_t kMaxGroupIdLength   = 64;
inline constexpr std::size_t kMaxDedupKeyLength  = 256;
inline constexpr std::size_t kMaxStateTypeLength = 64;

inline constexpr std::string_view kGlobalScope = "global";

// Written only by the coordinator when a session is created.
inline constexpr std::string_view kWorkflowConfigStateType = "workflow_config";

bool IsReservedStateType(std::string_view state_type);

void ValidateSessionId(std::string_view session_id);
void ValidateGroupId(std::string_view group_id);
void ValidateDedupKey(std::string_view dedup_key);
void ValidateStateType(std::string_view state_type);

// "global" or a valid group id.
void ValidateScope(std::string_view scope);

bool IsValidGroupId(std::string_view group_id);

// Issue ids are "{group}-{iteration}-{seq}" with iteration and seq >= 1.
std::string MakeIssueId(std::string_view group_id, uint32_t iteration, uint32_t sequence);
bool        IsWellFormedIssueId(std::string_view issue_id);
void        ValidateIssueId(std::string_view issue_id);

inline constexpr std::string_view kDigestKeyPrefix = "digest:";

// Derived dedup keys are "<base>#<suffix>". When that would not fit, the
// base is replaced by "digest:<fnv1a-64 of base>". The result is validated.
std::string DeriveDedupKey(std::string_view base, std::string_view suffix);

} // namespace baton::util
