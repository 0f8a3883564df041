#include "event_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace baton::store {

namespace v1 = baton::coordination::v1;

namespace {

constexpr std::array<std::pair<PayloadCase, std::string_view>, 10> kEventTypes = {{
    {v1::EventPayload::kIssuesRaised, event_type::kIssuesRaised},
    {v1::EventPayload::kIssueResponses, event_type::kIssueResponses},
    {v1::EventPayload::kScopeItemCompleted, event_type::kScopeItemCompleted},
    {v1::EventPayload::kScopeChange, event_type::kScopeChange},
    {v1::EventPayload::kCompletionDeclared, event_type::kCompletionDeclared},
    {v1::EventPayload::kValidatorVerdict, event_type::kValidatorVerdict},
    {v1::EventPayload::kRoleTimeout, event_type::kRoleTimeout},
    {v1::EventPayload::kEscalation, event_type::kEscalation},
    {v1::EventPayload::kRoutingDecision, event_type::kRoutingDecision},
    {v1::EventPayload::kAudit, event_type::kAudit},
}};

} // namespace

std::string_view EventTypeFor(PayloadCase kind) {
  for (const auto& [candidate, name] : kEventTypes) {
    if (candidate == kind) return name;
  }
  return {};
}

PayloadCase PayloadCaseFor(std::string_view event_type) {
  for (const auto& [kind, name] : kEventTypes) {
    if (name == event_type) return kind;
  }
  return v1::EventPayload::KIND_NOT_SET;
}

void CheckDiscriminator(std::string_view event_type, const v1::EventPayload& payload) {
  const auto expected = PayloadCaseFor(event_type);
  if (expected == v1::EventPayload::KIND_NOT_SET) {
    throw util::ValidationError("unknown event type: " + std::string(event_type));
  }
  if (payload.kind_case() != expected) {
    throw util::ValidationError("event type " + std::string(event_type) + " does not match payload variant " +
                                std::string(EventTypeFor(payload.kind_case())));
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::ValidationError("cannot encode " + std::string(message.GetTypeName()) + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::ValidationError("cannot decode " + std::string(message->GetTypeName()) + ": " + std::string(status.message()));
  }
}

std::string EncodePayload(const v1::EventPayload& payload) {
  return ToJson(payload);
}

v1::EventPayload DecodePayload(const std::string& json) {
  v1::EventPayload payload;
  try {
    FromJson(json, &payload);
  } catch (const util::ValidationError& e) {
    throw util::StateInconsistency(std::string("stored event payload is corrupt: ") + e.what());
  }
  return payload;
}

bool IsValidJson(const std::string& text) {
  google::protobuf::Value value;
  return google::protobuf::util::JsonStringToMessage(text, &value).ok();
}

} // namespace baton::store
