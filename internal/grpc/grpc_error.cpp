#include "grpc_error.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "internal/util/errors.hpp"

namespace baton::grpc {

namespace v1 = baton::coordination::v1;

::grpc::Status ToStatus(const std::exception& e) {
  using namespace baton::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const ConflictError*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const StateInconsistency*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

v1::ResultTag ResultTagFor(const std::exception& e) {
  using namespace baton::util;

  if (dynamic_cast<const ValidationError*>(&e) || dynamic_cast<const StateInconsistency*>(&e)) {
    return v1::RESULT_TAG_VALIDATION_ERROR;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return v1::RESULT_TAG_NOT_FOUND;
  }
  if (dynamic_cast<const ConflictError*>(&e)) {
    return v1::RESULT_TAG_CONFLICT;
  }
  return v1::RESULT_TAG_INTERNAL_ERROR;
}

std::string ResultTagName(v1::ResultTag tag) {
  constexpr std::string_view kPrefix = "RESULT_TAG_";

  std::string name = v1::ResultTag_Name(tag);
  if (name.rfind(kPrefix, 0) == 0) {
    name.erase(0, kPrefix.size());
  }
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return name.empty() ? "internal_error" : name;
}

} // namespace baton::grpc
