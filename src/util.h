#pragma once
#include <string>
#include <vector>

// Nearest MIDI note (A4 = 69), -1 for non-positive input.
int   hzToMidi(double hz);
float rms(const float* x, int n);
int   nextPowerOfTwo(int n);

enum class FrameStatus {
  Ok,
  EmptyFrame,
  InvalidSampleRate
};

FrameStatus checkFrame(const float* samples, int n, float sr);
std::string describeFrameStatus(FrameStatus status, int n, float sr);

// Reads any libsndfile-supported file, downmixing to mono.
bool loadWavMono(const std::string& path, std::vector<float>& out, float& sr);
