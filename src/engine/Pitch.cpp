#include "engine/Pitch.h"

#include <array>
#include <cctype>
#include <cmath>

namespace engine {

namespace {
constexpr int kDefaultMidiNote = 60;

const std::array<const char*, 12> kNoteNames = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

// Semitone offset of the natural note letters from C.
int LetterOffset(char letter) {
    switch (letter) {
        case 'C':
            return 0;
        case 'D':
            return 2;
        case 'E':
            return 4;
        case 'F':
            return 5;
        case 'G':
            return 7;
        case 'A':
            return 9;
        case 'B':
            return 11;
        default:
            return -1;
    }
}
}  // namespace

double MidiNoteToFrequency(int midiNote) {
    return 440.0 * std::pow(2.0, (static_cast<double>(midiNote) - 69.0) / 12.0);
}

double DetuneRatio(double cents) {
    return std::pow(2.0, cents / 1200.0);
}

std::string MidiToNoteName(int midiNote) {
    const int octave = static_cast<int>(std::floor(midiNote / 12.0)) - 1;
    const int index = ((midiNote % 12) + 12) % 12;
    return std::string(kNoteNames[static_cast<std::size_t>(index)]) + std::to_string(octave);
}

int NoteNameToMidi(std::string_view name) {
    if (name.size() < 2) {
        return kDefaultMidiNote;
    }
    const int letter = LetterOffset(name[0]);
    if (letter < 0) {
        return kDefaultMidiNote;
    }

    std::size_t pos = 1;
    int accidental = 0;
    if (name[pos] == '#') {
        accidental = 1;
        ++pos;
    } else if (name[pos] == 'b') {
        accidental = -1;
        ++pos;
    }
    if (pos >= name.size()) {
        return kDefaultMidiNote;
    }

    int octave = 0;
    for (; pos < name.size(); ++pos) {
        const auto ch = static_cast<unsigned char>(name[pos]);
        if (!std::isdigit(ch)) {
            return kDefaultMidiNote;
        }
        octave = octave * 10 + (ch - '0');
        if (octave > 99) {
            return kDefaultMidiNote;
        }
    }
    return (octave + 1) * 12 + letter + accidental;
}

}  // namespace engine
