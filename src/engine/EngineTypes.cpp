#include "engine/EngineTypes.h"

namespace engine {

const char* ToString(EngineError error) {
    switch (error) {
        case EngineError::None:
            return "None";
        case EngineError::InvalidInstrument:
            return "InvalidInstrument";
        case EngineError::AudioContextUnavailable:
            return "AudioContextUnavailable";
        case EngineError::RenderFailure:
            return "RenderFailure";
        case EngineError::SchedulingDrift:
            return "SchedulingDrift";
    }
    return "Unknown";
}

std::optional<DrumType> DrumTypeFromId(std::string_view id) {
    if (id == "kick") {
        return DrumType::Kick;
    }
    if (id == "snare") {
        return DrumType::Snare;
    }
    if (id == "hihat") {
        return DrumType::HiHat;
    }
    if (id == "clap") {
        return DrumType::Clap;
    }
    return std::nullopt;
}

const char* ToString(DrumType type) {
    switch (type) {
        case DrumType::Kick:
            return "kick";
        case DrumType::Snare:
            return "snare";
        case DrumType::HiHat:
            return "hihat";
        case DrumType::Clap:
            return "clap";
    }
    return "kick";
}

double SecondsPerTick(double bpm) {
    if (bpm <= 0.0) {
        return 0.0;
    }
    return 60.0 / bpm / 4.0;
}

}  // namespace engine
