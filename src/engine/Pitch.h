#pragma once

#include <string>
#include <string_view>

namespace engine {

// Equal temperament, A4 (69) = 440 Hz.
double MidiNoteToFrequency(int midiNote);
double DetuneRatio(double cents);

// 60 -> "C4", 61 -> "C#4". Sharps only.
std::string MidiToNoteName(int midiNote);
// Accepts "C4", "F#3", "Bb2". Anything else maps to 60.
int NoteNameToMidi(std::string_view name);

}  // namespace engine
