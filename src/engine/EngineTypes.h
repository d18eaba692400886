#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace engine {

struct ProcessBlock {
    float* output = nullptr;  // interleaved
    std::size_t frames = 0;
    uint16_t channels = 2;
};

enum class EngineError {
    None,
    InvalidInstrument,
    AudioContextUnavailable,
    RenderFailure,
    SchedulingDrift,
};

const char* ToString(EngineError error);

// One sixteenth-note grid event. Ticks are sixteenths.
struct NoteEvent {
    int pitch = 60;
    int startTick = 0;
    int durationTicks = 1;
    float velocity = 0.8f;
};

enum class DrumType { Kick, Snare, HiHat, Clap };

constexpr std::size_t kDrumTypeCount = 4;

std::optional<DrumType> DrumTypeFromId(std::string_view id);
const char* ToString(DrumType type);

struct DrumHit {
    DrumType type = DrumType::Kick;
    int step = 0;
    float volume = 0.8f;
};

struct ArrangementConfig {
    int bars = 8;
    int beatsPerBar = 4;
    int sixteenthsPerBeat = 4;

    int totalTicks() const { return bars * beatsPerBar * sixteenthsPerBeat; }
    int ticksPerBar() const { return beatsPerBar * sixteenthsPerBeat; }
};

// Length of one tick (a sixteenth) in seconds.
double SecondsPerTick(double bpm);

}  // namespace engine
