#pragma once

// Loudness gate: a frame is analysed only when its RMS is above the noise floor.
class SignalGate {
public:
  explicit SignalGate(float rmsFloor) : _rmsFloor(rmsFloor) {}

  bool  admit(const float* samples, int n) const;
  float measure(const float* samples, int n) const;
  float rmsFloor() const { return _rmsFloor; }

private:
  float _rmsFloor;
};
