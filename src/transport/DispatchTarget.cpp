#include "transport/DispatchTarget.h"

#include "engine/DrumSampler.h"
#include "engine/VoiceSynthesizer.h"

namespace transport {

SynthDispatchTarget::SynthDispatchTarget(engine::VoiceSynthesizer& synth,
                                         engine::DrumSampler* drums)
    : synth_(synth), drums_(drums) {}

bool SynthDispatchTarget::dispatchNote(const std::string& instrumentId,
                                       const engine::NoteEvent& note,
                                       double startTime,
                                       double durationSec) {
    return synth_.playNote(instrumentId, note.pitch, startTime, durationSec, note.velocity)
        .has_value();
}

bool SynthDispatchTarget::dispatchDrum(const engine::DrumHit& hit, double startTime) {
    if (!drums_) {
        return true;
    }
    return drums_->playDrum(hit.type, startTime, hit.volume).has_value();
}

bool SynthDispatchTarget::dispatchMetronome(double startTime, bool isDownbeat) {
    return synth_.playMetronomeClick(startTime, isDownbeat).has_value();
}

}  // namespace transport
