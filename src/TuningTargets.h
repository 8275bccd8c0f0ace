#pragma once

#include <array>
#include <string>

struct TargetString {
    const char* note;      // pitch class, e.g. "E"
    double frequencyHz;
    int stringNumber;      // 6 = low E .. 1 = high E
    const char* label;     // "sixth" .. "first"
};

inline constexpr int kNumStrings = 6;

// Standard tuning, low E first. The order is the order strings are tuned in.
const std::array<TargetString, kNumStrings>& standardTuning();

std::string targetDisplayName(int stringIndex);
