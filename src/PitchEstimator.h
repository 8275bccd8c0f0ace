#pragma once
#include "SignalGate.h"
#include "TunerConfig.h"

#include <optional>
#include <vector>

extern "C" {
#include <aubio/aubio.h>
}

enum class PitchSource {
  Autocorrelation,
  Spectrum
};

struct PitchReading {
  double frequencyHz = 0.0;
  float  confidence = 0.f;  // strongest normalized autocorrelation peak
  PitchSource source = PitchSource::Autocorrelation;
};

// Fundamental frequency of one gated frame: normalized autocorrelation over
// lags 2..n/2, refined by an aubio FFT peak near that period when the correlation is weak.
class PitchEstimator {
public:
  explicit PitchEstimator(const TunerConfig& cfg);
  ~PitchEstimator();
  PitchEstimator(const PitchEstimator&) = delete;
  PitchEstimator& operator=(const PitchEstimator&) = delete;

  // nullopt for silence, unreliable periodicity, out-of-band pitch or malformed input.
  std::optional<PitchReading> estimate(const float* samples, int n, float sr);

  const SignalGate& gate() const { return _gate; }
  // Strongest NCC peak seen by the last call that got past the gate.
  float lastCorrelation() const { return _lastCorrelation; }

private:
  struct LagPick {
    double lag = 0.0;
    float  correlation = 0.f;  // strongest peak, not necessarily at lag
  };

  std::optional<LagPick> autocorrelate(const float* x, int n);
  // Strongest in-band bin within a semitone of nearHz, or nullopt if it is not a local peak.
  std::optional<double> spectralPeak(const float* x, int n, float sr, double nearHz);
  bool configureSpectrum(int frameSize);
  void releaseSpectrum();
  bool inBand(double hz) const;

  TunerConfig _cfg;
  SignalGate _gate;
  std::vector<float> _centered;  // frame minus its mean
  std::vector<double> _energy;   // prefix sums of x^2
  std::vector<double> _corr;
  std::vector<int> _peaks;
  float _lastCorrelation = 0.f;

  int _spectrumFrame = 0;
  int _fftSize = 0;
  aubio_fft_t* _fft = nullptr;
  fvec_t*      _fftIn = nullptr;
  fvec_t*      _window = nullptr;
  cvec_t*      _spectrum = nullptr;
};
