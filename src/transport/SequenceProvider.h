#pragma once

#include <string>
#include <vector>

#include "engine/EngineTypes.h"

namespace transport {

// Source of the arrangement the transport plays. Implementations must be safe
// to call from the scheduling thread.
class SequenceProvider {
public:
    virtual ~SequenceProvider() = default;

    virtual std::vector<engine::NoteEvent> scheduledEvents() const = 0;
    virtual std::vector<engine::DrumHit> scheduledDrumHits() const = 0;
    virtual engine::ArrangementConfig config() const = 0;
    virtual std::string currentInstrument() const = 0;
    // Returns false when the note is rejected.
    virtual bool addNote(const engine::NoteEvent& note) = 0;
};

}  // namespace transport
