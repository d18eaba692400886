#include "engine/InstrumentRegistry.h"

#include <algorithm>
#include <utility>

namespace engine {

namespace {

using dsp::FilterType;
using dsp::Waveform;

InstrumentDefinition MakeInstrument(std::string id,
                                    std::string name,
                                    std::vector<OscillatorSpec> oscillators,
                                    Envelope envelope,
                                    std::optional<FilterSpec> filter = std::nullopt,
                                    bool distortion = false) {
    InstrumentDefinition def;
    def.id = std::move(id);
    def.name = std::move(name);
    def.oscillators = std::move(oscillators);
    def.envelope = envelope;
    def.filter = filter;
    def.distortion = distortion;
    return def;
}

}  // namespace

const std::vector<InstrumentDefinition>& BuiltInInstruments() {
    static const std::vector<InstrumentDefinition> kInstruments = {
        MakeInstrument("piano", "Piano",
                       {{Waveform::Triangle, 0.0, 0.6f}, {Waveform::Sine, 1.0, 0.4f}},
                       {0.005, 0.3, 0.4f, 0.5}),
        MakeInstrument("pluck", "Pluck",
                       {{Waveform::Sawtooth, 0.0, 0.5f}, {Waveform::Triangle, 2.0, 0.3f}},
                       {0.001, 0.15, 0.1f, 0.2},
                       FilterSpec{FilterType::Lowpass, 3000.0, 2.0}),
        MakeInstrument("saw", "Saw Lead",
                       {{Waveform::Sawtooth, 0.0, 0.4f},
                        {Waveform::Sawtooth, 7.0, 0.3f},
                        {Waveform::Sawtooth, -7.0, 0.3f}},
                       {0.05, 0.1, 0.7f, 0.2},
                       FilterSpec{FilterType::Lowpass, 5000.0, 1.0}),
        MakeInstrument("pad", "Soft Pad",
                       {{Waveform::Sine, 0.0, 0.4f},
                        {Waveform::Triangle, 5.0, 0.3f},
                        {Waveform::Sine, -5.0, 0.3f}},
                       {0.4, 0.5, 0.8f, 1.0}),
        MakeInstrument("bass", "Bass",
                       {{Waveform::Sawtooth, 0.0, 0.6f}, {Waveform::Sine, 0.0, 0.4f}},
                       {0.01, 0.2, 0.5f, 0.15},
                       FilterSpec{FilterType::Lowpass, 800.0, 3.0}),
        MakeInstrument("bell", "Bell",
                       {{Waveform::Sine, 0.0, 0.5f},
                        {Waveform::Sine, 1200.0, 0.3f},
                        {Waveform::Sine, 2400.0, 0.2f}},
                       {0.001, 1.0, 0.1f, 1.5}),
        MakeInstrument("fuzz", "Fuzz Lead",
                       {{Waveform::Square, 0.0, 0.5f}, {Waveform::Sawtooth, -5.0, 0.3f}},
                       {0.01, 0.2, 0.6f, 0.25},
                       FilterSpec{FilterType::Lowpass, 2500.0, 1.5}, true),
    };
    return kInstruments;
}

InstrumentRegistry::InstrumentRegistry()
    : InstrumentRegistry(BuiltInInstruments(), kDefaultInstrumentId) {}

InstrumentRegistry::InstrumentRegistry(std::vector<InstrumentDefinition> definitions,
                                       std::string defaultId)
    : definitions_(std::move(definitions)) {
    if (definitions_.empty()) {
        definitions_ = BuiltInInstruments();
        defaultId = kDefaultInstrumentId;
    }
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&defaultId](const InstrumentDefinition& def) {
                               return def.id == defaultId;
                           });
    defaultIndex_ = it == definitions_.end()
                        ? 0
                        : static_cast<std::size_t>(std::distance(definitions_.begin(), it));
}

const InstrumentDefinition* InstrumentRegistry::lookup(std::string_view id) const {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [id](const InstrumentDefinition& def) { return def.id == id; });
    if (it == definitions_.end()) {
        return nullptr;
    }
    return &(*it);
}

const InstrumentDefinition& InstrumentRegistry::find(std::string_view id) const {
    if (const auto* def = lookup(id)) {
        return *def;
    }
    return defaultInstrument();
}

bool InstrumentRegistry::contains(std::string_view id) const {
    return lookup(id) != nullptr;
}

std::vector<std::string> InstrumentRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(definitions_.size());
    for (const auto& def : definitions_) {
        result.push_back(def.id);
    }
    return result;
}

const InstrumentDefinition& InstrumentRegistry::defaultInstrument() const {
    return definitions_[defaultIndex_];
}

}  // namespace engine
