#pragma once
#include <optional>

struct SmoothingParams {
  double alpha = 0.3;
  double jumpAlpha = 0.5;
  double jumpRatio = 0.1;   // jump when |raw - smoothed| > smoothed * jumpRatio
};

// Stateless: the smoothed value lives in the caller's session.
class FrequencySmoother {
public:
  explicit FrequencySmoother(const SmoothingParams& params = SmoothingParams{});

  double smooth(std::optional<double> previous, double raw) const;
  // "No pitch" clears the memory instead of decaying it.
  std::optional<double> update(std::optional<double> previous, std::optional<double> raw) const;

  const SmoothingParams& params() const { return _params; }

private:
  SmoothingParams _params;
};
