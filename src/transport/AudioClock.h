#pragma once

namespace transport {

// Audio-side time base. All onset times handed to the synthesizers are in
// this clock's seconds.
class AudioClock {
public:
    virtual ~AudioClock() = default;

    virtual double currentTime() const = 0;
    // Brings the clock into the running state. Returns false when the audio
    // device cannot be started.
    virtual bool resume() = 0;
};

}  // namespace transport
