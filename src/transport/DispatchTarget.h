#pragma once

#include <string>

#include "engine/EngineTypes.h"

namespace engine {
class DrumSampler;
class VoiceSynthesizer;
}  // namespace engine

namespace transport {

// Receiver of the transport's precomputed onsets. Each call returns false when
// the sound could not be scheduled.
class DispatchTarget {
public:
    virtual ~DispatchTarget() = default;

    virtual bool dispatchNote(const std::string& instrumentId,
                              const engine::NoteEvent& note,
                              double startTime,
                              double durationSec) = 0;
    virtual bool dispatchDrum(const engine::DrumHit& hit, double startTime) = 0;
    virtual bool dispatchMetronome(double startTime, bool isDownbeat) = 0;
};

class SynthDispatchTarget : public DispatchTarget {
public:
    SynthDispatchTarget(engine::VoiceSynthesizer& synth, engine::DrumSampler* drums = nullptr);

    bool dispatchNote(const std::string& instrumentId,
                      const engine::NoteEvent& note,
                      double startTime,
                      double durationSec) override;
    bool dispatchDrum(const engine::DrumHit& hit, double startTime) override;
    bool dispatchMetronome(double startTime, bool isDownbeat) override;

private:
    engine::VoiceSynthesizer& synth_;
    engine::DrumSampler* drums_;
};

}  // namespace transport
