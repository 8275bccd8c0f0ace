#include "TuningTargets.h"

namespace {
constexpr std::array<TargetString, kNumStrings> kStandardTuning {{
    {"E", 82.41, 6, "sixth"},
    {"A", 110.00, 5, "fifth"},
    {"D", 146.83, 4, "fourth"},
    {"G", 196.00, 3, "third"},
    {"B", 246.94, 2, "second"},
    {"E", 329.63, 1, "first"}
}};
} // namespace

const std::array<TargetString, kNumStrings>& standardTuning() {
    return kStandardTuning;
}

std::string targetDisplayName(int stringIndex) {
    if (stringIndex < 0 || stringIndex >= kNumStrings)
        return std::string("String ") + std::to_string(stringIndex + 1);
    const auto& target = kStandardTuning[static_cast<std::size_t>(stringIndex)];
    return std::string(target.note) + " (" + target.label + " string)";
}
