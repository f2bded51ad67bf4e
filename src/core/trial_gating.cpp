#include "void_cmb/core/trial_gating.hpp"

namespace void_cmb::core {

TrialGateDecision evaluate_trial_gate(int succeeded_trials,
                                      int requested_trials, int min_trials) {
  TrialGateDecision out;
  if (succeeded_trials <= 0 || succeeded_trials < min_trials) {
    return out;
  }

  if (succeeded_trials < requested_trials) {
    out.mode = TrialMode::Degraded;
    out.degraded = true;
    out.should_abort = false;
    return out;
  }

  out.mode = TrialMode::Full;
  out.degraded = false;
  out.should_abort = false;
  return out;
}

} // namespace void_cmb::core
