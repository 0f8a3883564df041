#pragma once

#include <string>
#include <string_view>

#include "baton/coordination/v1.hpp"

namespace baton::store {

/*
  Event payload codec.

  Payloads are the EventPayload oneof, stored as JSON beside a plain
  event_type discriminator so the log stays readable with sqlite3 alone.
*/

namespace event_type {
inline constexpr std::string_view kIssuesRaised       = "issues_raised";
inline constexpr std::string_view kIssueResponses     = "issue_responses";
inline constexpr std::string_view kScopeItemCompleted = "scope_item_completed";
inline constexpr std::string_view kScopeChange        = "scope_change";
inline constexpr std::string_view kCompletionDeclared = "completion_declared";
inline constexpr std::string_view kValidatorVerdict   = "validator_verdict";
inline constexpr std::string_view kRoleTimeout        = "role_timeout";
inline constexpr std::string_view kEscalation         = "escalation";
inline constexpr std::string_view kRoutingDecision    = "routing_decision";
inline constexpr std::string_view kAudit              = "audit";
} // namespace event_type

using PayloadCase = baton::coordination::v1::EventPayload::KindCase;

// Empty view for KIND_NOT_SET.
std::string_view EventTypeFor(PayloadCase kind);

// KIND_NOT_SET for unknown names.
PayloadCase PayloadCaseFor(std::string_view event_type);

// Throws ValidationError when the type is unknown or disagrees with the payload case.
void CheckDiscriminator(std::string_view event_type, const baton::coordination::v1::EventPayload& payload);

std::string EncodePayload(const baton::coordination::v1::EventPayload& payload);

// Throws StateInconsistency for stored JSON that no longer parses.
baton::coordination::v1::EventPayload DecodePayload(const std::string& json);

// Generic proto <-> JSON used for snapshots and stored descriptors.
std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

// True when text parses as any JSON value.
bool IsValidJson(const std::string& text);

} // namespace baton::store
