#include "identifiers.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace baton::util {

namespace {

bool IsAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool IsDigits(std::string_view text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

bool AllOf(std::string_view value, std::string_view extra) {
  for (char c : value) {
    if (!IsAlnum(c) && extra.find(c) == std::string_view::npos) return false;
  }
  return true;
}

void Check(std::string_view what, std::string_view value, std::size_t max_length, std::string_view extra) {
  if (value.empty()) {
    throw ValidationError(std::string(what) + " must not be empty");
  }
  if (value.size() > max_length) {
    throw ValidationError(std::string(what) + " exceeds " + std::to_string(max_length) + " characters");
  }
  if (!AllOf(value, extra)) {
    throw ValidationError(std::string(what) + " contains invalid characters: " + std::string(value));
  }
}

uint64_t Fnv1a64(std::string_view data) {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string Hex64(uint64_t value) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out(16, '0');
  for (int i = 15; i >= 0; --i, value >>= 4) {
    out[static_cast<std::size_t>(i)] = kDigits[value & 0xf];
  }
  return out;
}

bool PositiveNumber(std::string_view digits) {
  return IsDigits(digits) && digits.size() <= 9 && digits.find_first_not_of('0') != std::string_view::npos;
}

} // namespace

void ValidateSessionId(std::string_view session_id) {
  Check("session id", session_id, kMaxSessionIdLength, "_.:-");
}

void ValidateGroupId(std::string_view group_id) {
  Check("group id", group_id, kMaxGroupIdLength, "_-");
}

void ValidateDedupKey(std::string_view dedup_key) {
  Check("dedup key", dedup_key, kMaxDedupKeyLength, "_.:#/-");
}

void ValidateStateType(std::string_view state_type) {
  Check("state type", state_type, kMaxStateTypeLength, "_.-");
}

void ValidateScope(std::string_view scope) {
  if (scope == kGlobalScope) return;
  if (scope.empty()) {
    throw ValidationError("scope must be 'global' or a group id");
  }
  ValidateGroupId(scope);
}

bool IsReservedStateType(std::string_view state_type) {
  return state_type == kWorkflowConfigStateType;
}

bool IsValidGroupId(std::string_view group_id) {
  return !group_id.empty() && group_id.size() <= kMaxGroupIdLength && AllOf(group_id, "_-");
}

std::string MakeIssueId(std::string_view group_id, uint32_t iteration, uint32_t sequence) {
  return std::string(group_id) + "-" + std::to_string(iteration) + "-" + std::to_string(sequence);
}

bool IsWellFormedIssueId(std::string_view issue_id) {
  const auto seq_dash = issue_id.rfind('-');
  if (seq_dash == std::string_view::npos || seq_dash == 0) return false;

  const auto iteration_dash = issue_id.rfind('-', seq_dash - 1);
  if (iteration_dash == std::string_view::npos) return false;

  const auto group     = issue_id.substr(0, iteration_dash);
  const auto iteration = issue_id.substr(iteration_dash + 1, seq_dash - iteration_dash - 1);
  const auto sequence  = issue_id.substr(seq_dash + 1);

  return IsValidGroupId(group) && PositiveNumber(iteration) && PositiveNumber(sequence);
}

void ValidateIssueId(std::string_view issue_id) {
  if (!IsWellFormedIssueId(issue_id)) {
    throw ValidationError("malformed issue id: " + std::string(issue_id));
  }
}

std::string DeriveDedupKey(std::string_view base, std::string_view suffix) {
  std::string key = std::string(base) + "#" + std::string(suffix);
  if (key.size() > kMaxDedupKeyLength) {
    key = std::string(kDigestKeyPrefix) + Hex64(Fnv1a64(base)) + "#" + std::string(suffix);
  }
  ValidateDedupKey(key);
  return key;
}

} // namespace baton::util
