#pragma once

#include <chrono>
#include <cstdint>

namespace baton::util {

/*
  Wall clock used for every stored timestamp (sessions, groups, events,
  state snapshots). Unix milliseconds throughout.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowMs();

// Lower bound for an EventFilter recency window; 0 when the window reaches past the epoch.
uint64_t WindowStartMs(uint64_t now_ms, uint64_t within_ms);

} // namespace baton::util
