#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "engine/EngineContext.h"
#include "engine/EngineTypes.h"
#include "transport/AudioClock.h"
#include "transport/DispatchTarget.h"
#include "transport/SchedulerTimer.h"

namespace fakes {

// Steppable audio clock.
class FakeClock : public transport::AudioClock {
public:
    double currentTime() const override { return time; }
    bool resume() override {
        ++resumeCalls;
        return resumable;
    }

    void advance(double seconds) { time += seconds; }

    double time = 0.0;
    bool resumable = true;
    int resumeCalls = 0;
};

// Timer that only fires when the test says so.
class ManualTimer : public transport::SchedulerTimer {
public:
    void start(double periodSec, Callback callback) override {
        period = periodSec;
        callback_ = std::move(callback);
        active_ = true;
        ++startCalls;
    }
    void stop() override {
        active_ = false;
        ++stopCalls;
    }
    bool running() const override { return active_; }
    double now() const override { return wallTime; }

    // Runs the callback once if the timer is running.
    bool fire() {
        if (!active_ || !callback_) {
            return false;
        }
        auto callback = callback_;
        callback();
        return true;
    }

    double wallTime = 0.0;
    double period = 0.0;
    int startCalls = 0;
    int stopCalls = 0;

private:
    Callback callback_;
    bool active_ = false;
};

struct DispatchedNote {
    std::string instrumentId;
    engine::NoteEvent note;
    double startTime = 0.0;
    double durationSec = 0.0;
};

struct DispatchedDrum {
    engine::DrumHit hit;
    double startTime = 0.0;
};

struct DispatchedClick {
    double startTime = 0.0;
    bool downbeat = false;
};

class RecordingTarget : public transport::DispatchTarget {
public:
    bool dispatchNote(const std::string& instrumentId,
                      const engine::NoteEvent& note,
                      double startTime,
                      double durationSec) override {
        notes.push_back({instrumentId, note, startTime, durationSec});
        return accept;
    }
    bool dispatchDrum(const engine::DrumHit& hit, double startTime) override {
        drums.push_back({hit, startTime});
        return accept;
    }
    bool dispatchMetronome(double startTime, bool isDownbeat) override {
        clicks.push_back({startTime, isDownbeat});
        return accept;
    }

    void clear() {
        notes.clear();
        drums.clear();
        clicks.clear();
    }

    bool accept = true;
    std::vector<DispatchedNote> notes;
    std::vector<DispatchedDrum> drums;
    std::vector<DispatchedClick> clicks;
};

// Pulls `seconds` of interleaved output from the context in fixed blocks.
inline std::vector<float> RenderFor(engine::EngineContext& context,
                                    double seconds,
                                    std::size_t blockFrames = 256) {
    const auto totalFrames =
        static_cast<std::size_t>(std::ceil(seconds * context.sampleRate()));
    const uint16_t channels = context.channels();
    std::vector<float> buffer(totalFrames * channels, 0.0f);
    std::size_t cursor = 0;
    while (cursor < totalFrames) {
        const std::size_t frames = std::min(blockFrames, totalFrames - cursor);
        engine::ProcessBlock block{buffer.data() + cursor * channels, frames, channels};
        context.process(block);
        cursor += frames;
    }
    return buffer;
}

inline float MaxAbs(const std::vector<float>& buffer, std::size_t start = 0, std::size_t end = 0) {
    if (end == 0 || end > buffer.size()) {
        end = buffer.size();
    }
    float peak = 0.0f;
    for (std::size_t i = start; i < end; ++i) {
        peak = std::max(peak, std::abs(buffer[i]));
    }
    return peak;
}

}  // namespace fakes
