#pragma once

#include <cstdint>
#include <string>

namespace baton::db::model {

/*
  Immutable event row.

  sequence is assigned by the repository on append and is strictly
  increasing across the whole database. dedup_key is globally unique.
*/
struct EventRecord {
  uint64_t    sequence = 0;
  std::string session_id;
  std::string group_id; // empty for session-level events
  std::string event_type;
  std::string payload_json;
  uint64_t    timestamp_ms = 0;
  std::string dedup_key;
};

}
