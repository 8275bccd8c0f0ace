#include "TuningStateMachine.h"
#include "CentsConverter.h"
#include "SessionLogger.h"

#include <algorithm>
#include <cmath>

const char* tuningPhaseKey(TuningPhase phase) {
  switch (phase) {
  case TuningPhase::Listening: return "listening";
  case TuningPhase::PendingConfirm: return "pending";
  case TuningPhase::AllTuned: return "all-tuned";
  }
  return "listening";
}

TuningStateMachine::TuningStateMachine(const TunerConfig& cfg)
: _cfg(cfg)
, _smoother(SmoothingParams{cfg.smoothingAlpha, cfg.jumpSmoothingAlpha, cfg.jumpRatio})
{
}

TuningPhase TuningStateMachine::phase() const {
  if (_session.allTuned)
    return TuningPhase::AllTuned;
  return _session.confirmDeadline ? TuningPhase::PendingConfirm : TuningPhase::Listening;
}

const TargetString& TuningStateMachine::currentTarget() const {
  return _cfg.targets[static_cast<std::size_t>(_session.targetIndex)];
}

bool TuningStateMachine::withinTolerance(std::optional<double> smoothedHz, const TargetString& target) const {
  if (!smoothedHz)
    return false;
  const auto cents = centsBetween(*smoothedHz, target.frequencyHz);
  if (!cents || std::fabs(*cents) > _cfg.toleranceCents)
    return false;
  if (_cfg.requireNoteMatch && noteName(*smoothedHz) != target.note)
    return false;
  return true;
}

TuningStatus TuningStateMachine::processEstimate(std::optional<double> rawHz, TickTime now) {
  if (_session.allTuned)
    return describe(now);
  _session.smoothedHz = _smoother.update(_session.smoothedHz, rawHz);
  return step(now);
}

TuningStatus TuningStateMachine::processSmoothed(std::optional<double> smoothedHz, TickTime now) {
  if (_session.allTuned)
    return describe(now);
  _session.smoothedHz = smoothedHz;
  return step(now);
}

TuningStatus TuningStateMachine::step(TickTime now) {
  const TargetString& target = currentTarget();
  const bool inTol = withinTolerance(_session.smoothedHz, target);

  if (_session.confirmDeadline) {
    if (!inTol) {
      SessionLogger::instance().logf("tuner", "cancel string=%d t=%lld hz=%.2f",
                                     target.stringNumber,
                                     static_cast<long long>(now.count()),
                                     _session.smoothedHz.value_or(0.0));
      _session.confirmDeadline.reset();
      _session.inTolerance = false;
      return describe(now);
    }
    if (now >= *_session.confirmDeadline) {
      const int confirmedIndex = _session.targetIndex;
      const double confirmedHz = *_session.smoothedHz;
      advance(now);
      TuningStatus status = describe(now);
      status.confirmedThisTick = true;
      status.confirmedStringIndex = confirmedIndex;
      SessionLogger::instance().logf("tuner", "confirm string=%d t=%lld hz=%.2f",
                                     _cfg.targets[static_cast<std::size_t>(confirmedIndex)].stringNumber,
                                     static_cast<long long>(now.count()), confirmedHz);
      return status;
    }
    return describe(now);
  }

  if (inTol && !_session.inTolerance) {
    _session.confirmDeadline = now + TickTime(_cfg.confirmDelayMs);
    SessionLogger::instance().logf("tuner", "arm string=%d t=%lld deadline=%lld hz=%.2f",
                                   target.stringNumber,
                                   static_cast<long long>(now.count()),
                                   static_cast<long long>(_session.confirmDeadline->count()),
                                   *_session.smoothedHz);
  }
  _session.inTolerance = inTol;
  return describe(now);
}

void TuningStateMachine::advance(TickTime now) {
  _session.smoothedHz.reset();
  _session.confirmDeadline.reset();
  _session.inTolerance = false;
  if (_session.targetIndex + 1 < kNumStrings) {
    ++_session.targetIndex;
  } else {
    _session.allTuned = true;
    SessionLogger::instance().logf("tuner", "all-tuned t=%lld", static_cast<long long>(now.count()));
  }
}

void TuningStateMachine::reset() {
  _session = TuningSession{};
  SessionLogger::instance().log("tuner", "reset");
}

TuningStatus TuningStateMachine::describe(TickTime now) const {
  TuningStatus status;
  status.target = currentTarget();
  status.targetIndex = _session.targetIndex;
  status.phase = phase();
  status.sessionComplete = _session.allTuned;
  status.time = now;
  if (_session.allTuned)
    return status;

  status.smoothedHz = _session.smoothedHz;
  status.inTolerance = _session.inTolerance;
  if (_session.smoothedHz) {
    status.cents = centsBetween(*_session.smoothedHz, status.target.frequencyHz);
    status.detectedNote = noteLabel(*_session.smoothedHz);
  }
  if (status.cents && _cfg.maxDisplayCents > 0.0) {
    const double clamped = std::clamp(*status.cents, -_cfg.maxDisplayCents, _cfg.maxDisplayCents);
    status.needlePosition = static_cast<float>(clamped / _cfg.maxDisplayCents);
  }
  return status;
}
