#pragma once
#include "PitchEstimator.h"
#include "TuningStateMachine.h"

#include <optional>
#include <string>

// One tick = one frame: gate, pitch, smoothing, cents, confirmation.
class TuningEngine {
public:
  explicit TuningEngine(const TunerConfig& cfg);
  TuningEngine(const TuningEngine&) = delete;
  TuningEngine& operator=(const TuningEngine&) = delete;

  // False with a message for a malformed frame; the session is left untouched.
  bool processTick(const float* samples, int n, int sampleRate, TickTime now,
                   TuningStatus& status, std::string* error = nullptr);
  void reset();

  const std::optional<PitchReading>& lastEstimate() const { return _lastEstimate; }
  const TuningStateMachine& stateMachine() const { return _machine; }
  const TunerConfig& config() const { return _cfg; }

private:
  TunerConfig _cfg;
  PitchEstimator _estimator;
  TuningStateMachine _machine;
  std::optional<PitchReading> _lastEstimate;
};
