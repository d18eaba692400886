#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dsp/Filter.h"
#include "dsp/Oscillator.h"

namespace engine {

struct OscillatorSpec {
    dsp::Waveform waveform = dsp::Waveform::Sine;
    double detuneCents = 0.0;
    float relativeGain = 1.0f;
};

struct Envelope {
    double attackSec = 0.01;
    double decaySec = 0.1;
    float sustainLevel = 0.7f;  // 0..1
    double releaseSec = 0.2;
};

struct FilterSpec {
    dsp::FilterType type = dsp::FilterType::Lowpass;
    double cutoffHz = 1000.0;
    double q = 1.0;
};

struct InstrumentDefinition {
    std::string id;
    std::string name;
    std::vector<OscillatorSpec> oscillators;
    Envelope envelope;
    std::optional<FilterSpec> filter;
    bool distortion = false;
};

const std::vector<InstrumentDefinition>& BuiltInInstruments();

// Read-only id -> definition table. Lookups of unknown ids fall back to the
// default instrument.
class InstrumentRegistry {
public:
    static constexpr const char* kDefaultInstrumentId = "piano";

    InstrumentRegistry();
    InstrumentRegistry(std::vector<InstrumentDefinition> definitions, std::string defaultId);

    const InstrumentDefinition& find(std::string_view id) const;
    bool contains(std::string_view id) const;
    std::vector<std::string> ids() const;
    const InstrumentDefinition& defaultInstrument() const;
    std::size_t size() const { return definitions_.size(); }

private:
    const InstrumentDefinition* lookup(std::string_view id) const;

    std::vector<InstrumentDefinition> definitions_;
    std::size_t defaultIndex_ = 0;
};

}  // namespace engine
