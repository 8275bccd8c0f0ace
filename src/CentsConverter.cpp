#include "CentsConverter.h"
#include "util.h"
#include <cmath>

std::optional<double> centsBetween(double detectedHz, double targetHz) {
  if (!(detectedHz > 0.0) || !(targetHz > 0.0))
    return std::nullopt;
  return 1200.0 * std::log2(detectedHz / targetHz);
}

std::string noteName(double hz) {
  if (!(hz > 0.0))
    return {};
  // semitones from A4; A sits 9 semitones above C, +48 keeps low octaves positive
  const long offset = std::lround(12.0 * std::log2(hz / kReferenceA4Hz));
  const long idx = ((offset + 9 + 48) % 12 + 12) % 12;
  return kNoteNames[static_cast<std::size_t>(idx)];
}

std::string noteLabel(double hz) {
  const int midi = hzToMidi(hz);
  if (midi < 0)
    return {};
  const int octave = midi / 12 - 1;
  return kNoteNames[static_cast<std::size_t>(midi % 12)] + std::to_string(octave);
}
