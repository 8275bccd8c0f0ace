#pragma once
#include "FrequencySmoother.h"
#include "TunerConfig.h"

#include <chrono>
#include <optional>
#include <string>

// Milliseconds of monotonic time since the driver started.
using TickTime = std::chrono::milliseconds;

enum class TuningPhase {
  Listening,
  PendingConfirm,
  AllTuned
};

const char* tuningPhaseKey(TuningPhase phase);

struct TuningSession {
  int targetIndex = 0;
  std::optional<double> smoothedHz;
  bool inTolerance = false;
  std::optional<TickTime> confirmDeadline;
  bool allTuned = false;
};

struct TuningStatus {
  TargetString target {};
  int targetIndex = 0;
  TuningPhase phase = TuningPhase::Listening;
  std::optional<double> smoothedHz;
  std::optional<double> cents;
  std::string detectedNote;           // "E2", empty without a smoothed value
  bool inTolerance = false;
  bool confirmedThisTick = false;
  bool sessionComplete = false;
  std::optional<int> confirmedStringIndex;
  float needlePosition = 0.f;         // [-1, 1], 0 without data
  TickTime time {0};
};

// Walks the six target strings in order. A string is confirmed once the smoothed pitch
// has stayed in tolerance until a deadline armed on entering tolerance; the deadline is
// checked on the ticks that follow, against that tick's value.
class TuningStateMachine {
public:
  explicit TuningStateMachine(const TunerConfig& cfg);

  // Raw estimate in, smoothing applied here. nullopt clears the smoothing memory.
  TuningStatus processEstimate(std::optional<double> rawHz, TickTime now);
  // For callers that already hold a smoothed value.
  TuningStatus processSmoothed(std::optional<double> smoothedHz, TickTime now);
  void reset();

  const TuningSession& session() const { return _session; }
  TuningPhase phase() const;
  const TargetString& currentTarget() const;
  const TunerConfig& config() const { return _cfg; }

  bool withinTolerance(std::optional<double> smoothedHz, const TargetString& target) const;

private:
  TuningStatus step(TickTime now);
  void advance(TickTime now);
  TuningStatus describe(TickTime now) const;

  TunerConfig _cfg;
  FrequencySmoother _smoother;
  TuningSession _session;
};
