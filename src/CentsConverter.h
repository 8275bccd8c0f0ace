#pragma once
#include <array>
#include <optional>
#include <string>

inline constexpr double kReferenceA4Hz = 440.0;
inline constexpr std::array<const char*, 12> kNoteNames {{
  "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
}};

// 1200 * log2(detected / target). No value when either frequency is not positive;
// callers must not read that as "in tune".
std::optional<double> centsBetween(double detectedHz, double targetHz);

// Nearest equal-tempered pitch class ("E", "A#", ...), empty for hz <= 0.
std::string noteName(double hz);

// Pitch class with scientific octave ("E2", "A4"), empty for hz <= 0.
std::string noteLabel(double hz);
