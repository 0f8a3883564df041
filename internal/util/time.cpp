#include "time.hpp"

namespace baton::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

uint64_t WindowStartMs(uint64_t now_ms, uint64_t within_ms) {
  return within_ms >= now_ms ? 0 : now_ms - within_ms;
}

} // namespace baton::util
