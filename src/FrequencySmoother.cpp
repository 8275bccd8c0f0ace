#include "FrequencySmoother.h"
#include <cmath>

FrequencySmoother::FrequencySmoother(const SmoothingParams& params)
: _params(params)
{
}

double FrequencySmoother::smooth(std::optional<double> previous, double raw) const {
  if (!previous)
    return raw;
  const double current = *previous;
  const double delta = raw - current;
  const bool bigJump = std::fabs(delta) > current * _params.jumpRatio;
  const double alpha = bigJump ? _params.jumpAlpha : _params.alpha;
  return current + delta * alpha;
}

std::optional<double> FrequencySmoother::update(std::optional<double> previous,
                                                std::optional<double> raw) const {
  if (!raw)
    return std::nullopt;
  return smooth(previous, *raw);
}
