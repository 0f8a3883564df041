#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace baton::db {

/*
  Event query. Unset filters match everything.

  Results are always in append (sequence) order. With a limit, the
  latest N matching events are returned, still in append order.
*/
struct EventQuery {
  std::string session_id;
  std::optional<std::string> group_id;
  std::optional<std::string> event_type;
  std::optional<uint64_t> min_timestamp_ms;
  std::optional<uint32_t> limit;
};

} // namespace baton::db
