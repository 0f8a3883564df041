#pragma once

#include <cstdint>

#include "baton/coordination/v1.hpp"

namespace baton::progress {

struct ProgressLimits {
  uint32_t max_iterations      = 3;
  uint32_t hard_cap_iterations = 10;
};

struct ProgressObservation {
  uint32_t iteration               = 0;
  uint32_t previous_blocking_count = 0;
  uint32_t current_blocking_count  = 0;
  uint32_t no_progress_streak      = 0;
  uint32_t attempts                = 0;
  bool     missed_deadline         = false;
};

struct ProgressVerdict {
  uint32_t iteration = 0;
  uint32_t attempts  = 0;
  bool     baseline  = false;
  bool     progress  = false;
  uint32_t streak    = 0;
  bool     warning   = false;
  bool     escalate  = false;
  bool     hard_cap  = false;
};

/*
  ProgressTracker

  Progress means the number of remaining blocking issues went down.
  Fixing something while the count stays put is not progress.

  iteration <= 1 is the baseline: it never counts against the streak.
  A missed deadline is never a baseline and never progress.

  The hard cap looks at attempts (reviews plus missed deadlines), so a
  group that only ever times out still terminates.
*/
class ProgressTracker {
 public:
  explicit ProgressTracker(ProgressLimits limits);

  ProgressVerdict Evaluate(const ProgressObservation& observation) const;

  const ProgressLimits& Limits() const {
    return limits_;
  }

 private:
  ProgressLimits limits_;
};

baton::coordination::v1::ProgressReport ToProto(const ProgressVerdict& verdict);

} // namespace baton::progress
