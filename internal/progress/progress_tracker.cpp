#include "progress_tracker.hpp"

#include <algorithm>

namespace baton::progress {

ProgressTracker::ProgressTracker(ProgressLimits limits) : limits_(limits) {
}

ProgressVerdict ProgressTracker::Evaluate(const ProgressObservation& observation) const {
  ProgressVerdict verdict;
  verdict.iteration = observation.iteration;
  verdict.attempts  = std::max(observation.attempts, observation.iteration);

  if (observation.missed_deadline) {
    verdict.streak = observation.no_progress_streak + 1;
  } else if (observation.iteration <= 1) {
    verdict.baseline = true;
    verdict.streak   = observation.no_progress_streak;
  } else if (observation.current_blocking_count < observation.previous_blocking_count) {
    verdict.progress = true;
    verdict.streak   = 0;
  } else {
    verdict.streak = observation.no_progress_streak + 1;
  }

  // streak > 0 keeps max_iterations == 1 from warning on a clean pass
  verdict.warning  = verdict.streak > 0 && verdict.streak + 1 == limits_.max_iterations;
  verdict.escalate = limits_.max_iterations > 0 && verdict.streak >= limits_.max_iterations;
  verdict.hard_cap = limits_.hard_cap_iterations > 0 && verdict.attempts >= limits_.hard_cap_iterations;
  return verdict;
}

baton::coordination::v1::ProgressReport ToProto(const ProgressVerdict& verdict) {
  baton::coordination::v1::ProgressReport report;
  report.set_iteration(verdict.iteration);
  report.set_baseline(verdict.baseline);
  report.set_progress(verdict.progress);
  report.set_streak(verdict.streak);
  report.set_warning(verdict.warning);
  report.set_escalate(verdict.escalate);
  report.set_hard_cap(verdict.hard_cap);
  report.set_attempts(verdict.attempts);
  return report;
}

} // namespace baton::progress
