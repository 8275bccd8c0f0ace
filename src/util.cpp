#include "util.h"
#include <cmath>
#include <sndfile.h>
#include <algorithm>

int hzToMidi(double hz) {
  if (hz <= 0.0) return -1;
  return int(std::lround(69.0 + 12.0 * std::log2(hz / 440.0)));
}

float rms(const float* x, int n) {
  if (!x || n <= 0) return 0.f;
  double s = 0.0;
  for (int i = 0; i < n; ++i) s += double(x[i]) * double(x[i]);
  return float(std::sqrt(s / std::max(1, n)));
}

int nextPowerOfTwo(int n) {
  int p = 1;
  while (p < n) p <<= 1;
  return p;
}

FrameStatus checkFrame(const float* samples, int n, float sr) {
  if (!samples || n <= 0) return FrameStatus::EmptyFrame;
  if (!(sr > 0.f) || !std::isfinite(sr)) return FrameStatus::InvalidSampleRate;
  return FrameStatus::Ok;
}

std::string describeFrameStatus(FrameStatus status, int n, float sr) {
  switch (status) {
    case FrameStatus::Ok:
      return {};
    case FrameStatus::EmptyFrame:
      return "audio frame is empty (" + std::to_string(n) + " samples)";
    case FrameStatus::InvalidSampleRate:
      return "sample rate must be positive (got " + std::to_string(sr) + " Hz)";
  }
  return "invalid audio frame";
}

bool loadWavMono(const std::string &path, std::vector<float> &out, float &sr) {
  SF_INFO info{};
  SNDFILE* sf = sf_open(path.c_str(), SFM_READ, &info);
  if (!sf) return false;
  if (info.channels <= 0 || info.frames <= 0) {
    sf_close(sf);
    return false;
  }
  sr = float(info.samplerate);
  std::vector<float> tmp(size_t(info.frames) * size_t(info.channels));
  const sf_count_t got = sf_readf_float(sf, tmp.data(), info.frames);
  sf_close(sf);
  if (got <= 0) return false;

  out.resize(size_t(got));
  if (info.channels == 1) {
    std::copy(tmp.begin(), tmp.begin() + got, out.begin());
  } else {
    for (sf_count_t i = 0; i < got; ++i) {
      double sum = 0.0;
      for (int c = 0; c < info.channels; ++c)
        sum += tmp[size_t(i) * size_t(info.channels) + size_t(c)];
      out[size_t(i)] = float(sum / info.channels);
    }
  }
  return true;
}
