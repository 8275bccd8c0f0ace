#include "TuningEngine.h"
#include "SessionLogger.h"
#include "util.h"

#include <mutex>

namespace {
std::once_flag gLoggedTunerSettings;

void logTunerSettingsOnce(const TunerConfig& cfg) {
  std::call_once(gLoggedTunerSettings, [&]() {
    auto& logger = SessionLogger::instance();
    logger.logf("tuner-settings",
                "tolerance=%.2fc confirm=%dms alpha=%.3f jumpAlpha=%.3f jumpRatio=%.3f band=%.1f-%.1fHz",
                cfg.toleranceCents,
                cfg.confirmDelayMs,
                cfg.smoothingAlpha,
                cfg.jumpSmoothingAlpha,
                cfg.jumpRatio,
                cfg.minFrequencyHz,
                cfg.maxFrequencyHz);
    logger.logf("tuner-settings",
                "rmsFloor=%.5f minCorr=%.3f preferCorr=%.3f strategy=%s noteMatch=%d",
                cfg.rmsFloor,
                cfg.minCorrelation,
                cfg.preferCorrelation,
                pitchStrategyKey(cfg.strategy),
                cfg.requireNoteMatch ? 1 : 0);
    for (int s = 0; s < kNumStrings; ++s) {
      const TargetString& t = cfg.targets[static_cast<std::size_t>(s)];
      logger.logf("tuner-settings", "target%d string=%d note=%s hz=%.2f midi=%d",
                  s, t.stringNumber, t.note, t.frequencyHz, hzToMidi(t.frequencyHz));
    }
  });
}
} // namespace

TuningEngine::TuningEngine(const TunerConfig& cfg)
: _cfg(cfg), _estimator(cfg), _machine(cfg)
{
  logTunerSettingsOnce(_cfg);
}

bool TuningEngine::processTick(const float* samples, int n, int sampleRate, TickTime now,
                               TuningStatus& status, std::string* error) {
  const FrameStatus frame = checkFrame(samples, n, static_cast<float>(sampleRate));
  if (frame != FrameStatus::Ok) {
    const std::string message = describeFrameStatus(frame, n, static_cast<float>(sampleRate));
    SessionLogger::instance().logf("tuner", "rejected-frame t=%lld %s",
                                   static_cast<long long>(now.count()), message.c_str());
    if (error)
      *error = message;
    return false;
  }

  _lastEstimate = _estimator.estimate(samples, n, static_cast<float>(sampleRate));
  std::optional<double> rawHz;
  if (_lastEstimate)
    rawHz = _lastEstimate->frequencyHz;
  status = _machine.processEstimate(rawHz, now);
  return true;
}

void TuningEngine::reset() {
  _machine.reset();
  _lastEstimate.reset();
}
