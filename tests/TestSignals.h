#pragma once

#include <cmath>
#include <random>
#include <vector>

namespace testsignals {

inline constexpr double kPi = 3.14159265358979323846;

inline std::vector<float> sine(double hz, int sampleRate, int n, float amplitude = 0.5f) {
    std::vector<float> out(static_cast<std::size_t>(n));
    const double step = 2.0 * kPi * hz / sampleRate;
    for (int i = 0; i < n; ++i)
        out[static_cast<std::size_t>(i)] = amplitude * static_cast<float>(std::sin(step * i));
    return out;
}

inline std::vector<float> noise(int n, float amplitude, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-amplitude, amplitude);
    std::vector<float> out(static_cast<std::size_t>(n));
    for (auto& v : out)
        v = dist(rng);
    return out;
}

inline std::vector<float> mix(const std::vector<float>& a, const std::vector<float>& b) {
    std::vector<float> out(a.size());
    for (std::size_t i = 0; i < a.size(); ++i)
        out[i] = a[i] + (i < b.size() ? b[i] : 0.f);
    return out;
}

}
