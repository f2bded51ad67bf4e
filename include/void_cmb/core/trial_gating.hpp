#pragma once

namespace void_cmb::core {

enum class TrialMode {
  AbortInsufficient,
  Degraded,
  Full,
};

struct TrialGateDecision {
  TrialMode mode = TrialMode::AbortInsufficient;
  bool degraded = false;
  bool should_abort = true;
};

// Decide whether a null distribution built from `succeeded_trials` of
// `requested_trials` is usable; below `min_trials` the run aborts.
TrialGateDecision evaluate_trial_gate(int succeeded_trials,
                                      int requested_trials, int min_trials);

} // namespace void_cmb::core
