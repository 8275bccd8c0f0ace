#include "TunerConfig.h"

#include <cmath>
#include <cstdio>

namespace {

const std::array<ParameterDescriptor, 11> kDescriptors {{
    {TunerParameter::ToleranceCents, "toleranceCents", "Tolerance (cents)", "Maximum deviation accepted as in tune, inclusive.", 1.0, 50.0, 0.5},
    {TunerParameter::ConfirmDelayMs, "confirmDelayMs", "Confirmation Delay (ms)", "Time a string must stay in tune before it is confirmed.", 100.0, 5000.0, 50.0},
    {TunerParameter::SmoothingAlpha, "smoothingAlpha", "Smoothing", "Exponential smoothing factor for small pitch changes.", 0.01, 1.0, 0.01},
    {TunerParameter::JumpSmoothingAlpha, "jumpSmoothingAlpha", "Jump Smoothing", "Smoothing factor used after a large pitch jump.", 0.01, 1.0, 0.01},
    {TunerParameter::JumpRatio, "jumpRatio", "Jump Ratio", "Relative change that counts as a new note.", 0.01, 1.0, 0.01},
    {TunerParameter::MinFrequencyHz, "minFrequencyHz", "Lowest Pitch (Hz)", "Estimates below this are discarded as noise.", 20.0, 1000.0, 1.0},
    {TunerParameter::MaxFrequencyHz, "maxFrequencyHz", "Highest Pitch (Hz)", "Estimates above this are discarded as noise.", 40.0, 2000.0, 1.0},
    {TunerParameter::RmsFloor, "rmsFloor", "Noise Floor (RMS)", "Frames quieter than this are not analysed.", 0.0001, 0.5, 0.0001},
    {TunerParameter::MinCorrelation, "minCorrelation", "Min Correlation", "Autocorrelation confidence required to report a pitch.", 0.05, 0.99, 0.01},
    {TunerParameter::PreferCorrelation, "preferCorrelation", "Trusted Correlation", "Above this the autocorrelation pitch is used without the FFT pass.", 0.05, 1.0, 0.01},
    {TunerParameter::MaxDisplayCents, "maxDisplayCents", "Needle Range (cents)", "Deviation mapped to a full needle swing.", 5.0, 200.0, 1.0}
}};

} // namespace

TunerConfig makeDefaultTunerConfig() {
    return TunerConfig{};
}

const std::array<ParameterDescriptor, 11>& parameterDescriptors() {
    return kDescriptors;
}

double parameterValue(const TunerConfig& cfg, TunerParameter id) {
    switch (id) {
        case TunerParameter::ToleranceCents: return cfg.toleranceCents;
        case TunerParameter::ConfirmDelayMs: return static_cast<double>(cfg.confirmDelayMs);
        case TunerParameter::SmoothingAlpha: return cfg.smoothingAlpha;
        case TunerParameter::JumpSmoothingAlpha: return cfg.jumpSmoothingAlpha;
        case TunerParameter::JumpRatio: return cfg.jumpRatio;
        case TunerParameter::MinFrequencyHz: return cfg.minFrequencyHz;
        case TunerParameter::MaxFrequencyHz: return cfg.maxFrequencyHz;
        case TunerParameter::RmsFloor: return static_cast<double>(cfg.rmsFloor);
        case TunerParameter::MinCorrelation: return static_cast<double>(cfg.minCorrelation);
        case TunerParameter::PreferCorrelation: return static_cast<double>(cfg.preferCorrelation);
        case TunerParameter::MaxDisplayCents: return cfg.maxDisplayCents;
    }
    return 0.0;
}

void setParameterValue(TunerConfig& cfg, TunerParameter id, double value) {
    switch (id) {
        case TunerParameter::ToleranceCents: cfg.toleranceCents = value; break;
        case TunerParameter::ConfirmDelayMs: cfg.confirmDelayMs = static_cast<int>(std::lround(value)); break;
        case TunerParameter::SmoothingAlpha: cfg.smoothingAlpha = value; break;
        case TunerParameter::JumpSmoothingAlpha: cfg.jumpSmoothingAlpha = value; break;
        case TunerParameter::JumpRatio: cfg.jumpRatio = value; break;
        case TunerParameter::MinFrequencyHz: cfg.minFrequencyHz = value; break;
        case TunerParameter::MaxFrequencyHz: cfg.maxFrequencyHz = value; break;
        case TunerParameter::RmsFloor: cfg.rmsFloor = static_cast<float>(value); break;
        case TunerParameter::MinCorrelation: cfg.minCorrelation = static_cast<float>(value); break;
        case TunerParameter::PreferCorrelation: cfg.preferCorrelation = static_cast<float>(value); break;
        case TunerParameter::MaxDisplayCents: cfg.maxDisplayCents = value; break;
    }
}

const char* pitchStrategyKey(PitchStrategy strategy) {
    switch (strategy) {
        case PitchStrategy::Autocorrelation: return "autocorrelation";
        case PitchStrategy::Hybrid: return "hybrid";
    }
    return "hybrid";
}

std::optional<PitchStrategy> pitchStrategyFromKey(const std::string& key) {
    if (key == "autocorrelation")
        return PitchStrategy::Autocorrelation;
    if (key == "hybrid")
        return PitchStrategy::Hybrid;
    return std::nullopt;
}

bool validateTunerConfig(const TunerConfig& cfg, std::string* error) {
    const auto fail = [error](const std::string& message) {
        if (error)
            *error = message;
        return false;
    };

    for (const auto& desc : kDescriptors) {
        const double value = parameterValue(cfg, desc.id);
        if (!std::isfinite(value) || value < desc.minValue || value > desc.maxValue) {
            char buffer[160];
            std::snprintf(buffer, sizeof(buffer), "%s=%g is outside [%g, %g]",
                          desc.key.c_str(), value, desc.minValue, desc.maxValue);
            return fail(buffer);
        }
    }

    if (cfg.minFrequencyHz >= cfg.maxFrequencyHz)
        return fail("minFrequencyHz must be below maxFrequencyHz");
    if (cfg.preferCorrelation < cfg.minCorrelation)
        return fail("preferCorrelation must not be below minCorrelation");
    return true;
}
