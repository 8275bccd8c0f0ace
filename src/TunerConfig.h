#pragma once

#include "TuningTargets.h"

#include <array>
#include <optional>
#include <string>

enum class PitchStrategy {
    Autocorrelation, // NCC only
    Hybrid           // NCC, with an FFT peak when NCC confidence is below preferCorrelation
};

struct TunerConfig {
    // Accepted deviation from the target, inclusive.
    double toleranceCents {8.0};
    // Sustained in-tolerance time before a string is confirmed.
    int confirmDelayMs {800};

    double smoothingAlpha {0.3};
    double jumpSmoothingAlpha {0.5};
    // |raw - smoothed| > smoothed * jumpRatio counts as a new note.
    double jumpRatio {0.1};

    double minFrequencyHz {50.0};
    double maxFrequencyHz {400.0};

    float rmsFloor {0.01f};
    // NCC peaks below this are treated as noise. Raising it cuts octave/harmonic
    // false positives at the cost of slower detection on decaying notes.
    float minCorrelation {0.30f};
    float preferCorrelation {0.90f};
    PitchStrategy strategy {PitchStrategy::Hybrid};

    bool requireNoteMatch {true};
    double maxDisplayCents {50.0};

    std::array<TargetString, kNumStrings> targets {standardTuning()};
};

TunerConfig makeDefaultTunerConfig();

enum class TunerParameter {
    ToleranceCents,
    ConfirmDelayMs,
    SmoothingAlpha,
    JumpSmoothingAlpha,
    JumpRatio,
    MinFrequencyHz,
    MaxFrequencyHz,
    RmsFloor,
    MinCorrelation,
    PreferCorrelation,
    MaxDisplayCents
};

struct ParameterDescriptor {
    TunerParameter id;
    std::string key;
    std::string label;
    std::string description;
    double minValue;
    double maxValue;
    double step;
};

const std::array<ParameterDescriptor, 11>& parameterDescriptors();

double parameterValue(const TunerConfig& cfg, TunerParameter id);
void setParameterValue(TunerConfig& cfg, TunerParameter id, double value);

const char* pitchStrategyKey(PitchStrategy strategy);
std::optional<PitchStrategy> pitchStrategyFromKey(const std::string& key);

// Range checks from the descriptor table plus the cross-field rules.
bool validateTunerConfig(const TunerConfig& cfg, std::string* error = nullptr);
