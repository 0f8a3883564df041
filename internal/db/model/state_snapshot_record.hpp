#pragma once

#include <cstdint>
#include <string>

namespace baton::db::model {

// Latest-wins state, keyed by (session_id, scope, state_type).
struct StateSnapshotRecord {
  std::string session_id;
  std::string scope;
  std::string state_type;
  std::string payload_json;
  uint64_t    updated_at_ms = 0;
};

}
