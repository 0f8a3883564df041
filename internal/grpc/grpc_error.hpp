#pragma once

#include <exception>
#include <string>

#include <grpcpp/grpcpp.h>

#include "baton/coordination/v1.hpp"

namespace baton::grpc {

/*
  Converts internal exceptions into gRPC status codes and result tags.
*/

inline constexpr char kResultMetadataKey[] = "baton-result";

::grpc::Status ToStatus(const std::exception& e);

baton::coordination::v1::ResultTag ResultTagFor(const std::exception& e);

// "ok", "validation_error", "not_found", "conflict", "internal_error".
std::string ResultTagName(baton::coordination::v1::ResultTag tag);

} // namespace baton::grpc
