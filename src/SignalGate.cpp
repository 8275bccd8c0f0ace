#include "SignalGate.h"
#include "util.h"

float SignalGate::measure(const float* samples, int n) const {
  return rms(samples, n);
}

bool SignalGate::admit(const float* samples, int n) const {
  if (!samples || n <= 0)
    return false;
  return measure(samples, n) > _rmsFloor;
}
