#include "PitchEstimator.h"
#include "SessionLogger.h"
#include "util.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace {
constexpr int kMinLagSamples = 2;
// The first NCC peak within this fraction of the strongest one wins, so an integer
// lag near 2x the period cannot beat the period itself by quantization alone.
constexpr double kPeakPickRatio = 0.9;
constexpr int kSpectrumZeroPad = 4;
// The spectrum only refines the NCC period; search this far either side of it.
const double kSpectrumSearchRatio = std::pow(2.0, 1.0 / 12.0);

double parabolicOffset(double a, double b, double c) {
  const double denom = a - 2.0 * b + c;
  if (std::fabs(denom) < 1e-12)
    return 0.0;
  const double offset = 0.5 * (a - c) / denom;
  return std::fabs(offset) < 1.0 ? offset : 0.0;
}
} // namespace

PitchEstimator::PitchEstimator(const TunerConfig& cfg)
: _cfg(cfg), _gate(cfg.rmsFloor)
{
}

PitchEstimator::~PitchEstimator() {
  releaseSpectrum();
}

bool PitchEstimator::inBand(double hz) const {
  return hz >= _cfg.minFrequencyHz && hz <= _cfg.maxFrequencyHz;
}

std::optional<PitchReading> PitchEstimator::estimate(const float* samples, int n, float sr) {
  if (checkFrame(samples, n, sr) != FrameStatus::Ok)
    return std::nullopt;
  if (!_gate.admit(samples, n))
    return std::nullopt;

  // Correlation and spectrum run on the AC part of the frame.
  double mean = 0.0;
  for (int i = 0; i < n; ++i)
    mean += samples[i];
  mean /= n;
  _centered.resize(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i)
    _centered[i] = static_cast<float>(samples[i] - mean);

  const auto pick = autocorrelate(_centered.data(), n);
  if (!pick) {
    _lastCorrelation = 0.f;
    return std::nullopt;
  }
  _lastCorrelation = pick->correlation;
  if (pick->correlation < _cfg.minCorrelation)
    return std::nullopt;

  PitchReading reading;
  reading.frequencyHz = static_cast<double>(sr) / pick->lag;
  reading.confidence = pick->correlation;
  reading.source = PitchSource::Autocorrelation;
  if (!inBand(reading.frequencyHz))
    return std::nullopt;

  if (_cfg.strategy == PitchStrategy::Hybrid && pick->correlation < _cfg.preferCorrelation) {
    if (const auto spectrumHz = spectralPeak(_centered.data(), n, sr, reading.frequencyHz)) {
      reading.frequencyHz = *spectrumHz;
      reading.source = PitchSource::Spectrum;
    }
  }

  if (!inBand(reading.frequencyHz))
    return std::nullopt;
  return reading;
}

std::optional<PitchEstimator::LagPick> PitchEstimator::autocorrelate(const float* x, int n) {
  const int maxLag = n / 2;
  if (maxLag < kMinLagSamples + 2)
    return std::nullopt;

  _energy.assign(static_cast<std::size_t>(n) + 1, 0.0);
  for (int i = 0; i < n; ++i)
    _energy[i + 1] = _energy[i] + double(x[i]) * double(x[i]);

  _corr.assign(static_cast<std::size_t>(maxLag) + 1, 0.0);
  for (int lag = kMinLagSamples; lag <= maxLag; ++lag) {
    const int overlap = n - lag;
    double sxy = 0.0;
    for (int i = 0; i < overlap; ++i)
      sxy += double(x[i]) * double(x[i + lag]);
    const double sxx = _energy[overlap];
    const double syy = _energy[n] - _energy[lag];
    const double denom = std::sqrt(sxx * syy);
    _corr[lag] = denom > 0.0 ? sxy / denom : 0.0;
  }

  // Candidate peaks are the maxima of the positive lobes after the zero-lag lobe.
  _peaks.clear();
  int lag = kMinLagSamples;
  while (lag <= maxLag && _corr[lag] > 0.0)
    ++lag;
  while (lag <= maxLag) {
    while (lag <= maxLag && _corr[lag] <= 0.0)
      ++lag;
    if (lag > maxLag)
      break;
    int best = lag;
    for (; lag <= maxLag && _corr[lag] > 0.0; ++lag) {
      if (_corr[lag] > _corr[best])
        best = lag;
    }
    if (best < maxLag)
      _peaks.push_back(best);
  }
  if (_peaks.empty())
    return std::nullopt;

  double strongest = 0.0;
  for (int peak : _peaks)
    strongest = std::max(strongest, _corr[peak]);

  int chosen = _peaks.front();
  for (int peak : _peaks) {
    if (_corr[peak] >= kPeakPickRatio * strongest) {
      chosen = peak;
      break;
    }
  }

  LagPick pick;
  pick.lag = chosen + parabolicOffset(_corr[chosen - 1], _corr[chosen], _corr[chosen + 1]);
  pick.correlation = static_cast<float>(strongest);
  return pick;
}

bool PitchEstimator::configureSpectrum(int frameSize) {
  if (frameSize == _spectrumFrame && _fft)
    return true;

  releaseSpectrum();
  const int fftSize = nextPowerOfTwo(frameSize) * kSpectrumZeroPad;
  char windowType[] = "hanning";
  _fft = new_aubio_fft(static_cast<uint_t>(fftSize));
  _fftIn = new_fvec(static_cast<uint_t>(fftSize));
  _window = new_aubio_window(windowType, static_cast<uint_t>(frameSize));
  _spectrum = new_cvec(static_cast<uint_t>(fftSize));

  if (!_fft || !_fftIn || !_window || !_spectrum) {
    std::fprintf(stderr, "PitchEstimator: aubio FFT init failed (size=%d frame=%d)\n", fftSize, frameSize);
    SessionLogger::instance().logf("pitch", "aubio-fft-init-failed size=%d frame=%d", fftSize, frameSize);
    releaseSpectrum();
    return false;
  }

  _fftSize = fftSize;
  _spectrumFrame = frameSize;
  SessionLogger::instance().logf("pitch", "spectrum configured frame=%d fft=%d", frameSize, fftSize);
  return true;
}

void PitchEstimator::releaseSpectrum() {
  if (_fft) { del_aubio_fft(_fft); _fft = nullptr; }
  if (_fftIn) { del_fvec(_fftIn); _fftIn = nullptr; }
  if (_window) { del_fvec(_window); _window = nullptr; }
  if (_spectrum) { del_cvec(_spectrum); _spectrum = nullptr; }
  _fftSize = 0;
  _spectrumFrame = 0;
}

std::optional<double> PitchEstimator::spectralPeak(const float* x, int n, float sr, double nearHz) {
  if (!configureSpectrum(n))
    return std::nullopt;

  for (int i = 0; i < n; ++i)
    _fftIn->data[i] = static_cast<smpl_t>(x[i]) * _window->data[i];
  for (int i = n; i < _fftSize; ++i)
    _fftIn->data[i] = 0;

  aubio_fft_do(_fft, _fftIn, _spectrum);

  const double binHz = static_cast<double>(sr) / static_cast<double>(_fftSize);
  const int lastBin = static_cast<int>(_spectrum->length) - 2;
  const double loHz = std::max(_cfg.minFrequencyHz, nearHz / kSpectrumSearchRatio);
  const double hiHz = std::min(_cfg.maxFrequencyHz, nearHz * kSpectrumSearchRatio);
  const int lo = std::max(1, static_cast<int>(std::floor(loHz / binHz)));
  const int hi = std::min(lastBin, static_cast<int>(std::ceil(hiHz / binHz)));
  if (hi <= lo)
    return std::nullopt;

  int peak = lo;
  for (int k = lo + 1; k <= hi; ++k) {
    if (_spectrum->norm[k] > _spectrum->norm[peak])
      peak = k;
  }
  // A maximum on the window edge is the skirt of a neighbouring partial, not a peak.
  if (_spectrum->norm[peak] <= 0 || _spectrum->norm[peak] < _spectrum->norm[peak - 1]
      || _spectrum->norm[peak] < _spectrum->norm[peak + 1])
    return std::nullopt;

  const double offset = parabolicOffset(_spectrum->norm[peak - 1], _spectrum->norm[peak], _spectrum->norm[peak + 1]);
  return (static_cast<double>(peak) + offset) * binHz;
}
