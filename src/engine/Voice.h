#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "dsp/Filter.h"
#include "dsp/Oscillator.h"
#include "dsp/ParamTimeline.h"
#include "engine/EngineContext.h"

namespace engine {

struct Envelope;

// Absolute breakpoint times of one scheduled note envelope.
struct EnvelopeSchedule {
    double startTime = 0.0;
    double attackEnd = 0.0;
    double decayEnd = 0.0;
    double releaseStart = 0.0;
    double releaseEnd = 0.0;
    float peakLevel = 0.0f;
    float sustainLevel = 0.0f;
    // Level at releaseStart; differs from sustainLevel when the note is
    // shorter than attack + decay.
    float releaseLevel = 0.0f;
};

// Writes a four-stage envelope onto `gain`: 0 at start, linear to velocity at
// the end of the attack, linear to sustain * velocity at the end of the decay,
// hold until start + duration, linear to 0 over the release. Zero-length
// phases become immediate value changes.
EnvelopeSchedule ScheduleEnvelope(dsp::ParamTimeline& gain,
                                  const Envelope& envelope,
                                  double startTime,
                                  double durationSec,
                                  float velocity);

// Owned node collection of one sounding note: oscillators with their gains,
// an optional filter/distortion chain and an envelope gain, fanned out to a
// fixed set of buses. Freed as a unit when the context reclaims it.
class Voice : public Source {
public:
    static constexpr double kOscillatorStopMargin = 0.1;
    static constexpr double kReclaimMargin = 0.2;
    static constexpr double kStopRampSeconds = 0.05;

    Voice(double sampleRate, double startTime);

    void addOscillator(dsp::Waveform waveform, double frequencyHz, float gain);
    void addProcessor(std::unique_ptr<dsp::Filter> processor);
    void addOutput(Bus bus);
    dsp::ParamTimeline& envelope() { return envelope_; }
    const dsp::ParamTimeline& envelope() const { return envelope_; }
    void setStopTimes(double oscillatorStopTime, double reclaimTime);

    double startTime() const { return startTime_; }
    double oscillatorStopTime() const { return oscStopTime_; }
    double reclaimTime() const { return reclaimTime_; }
    std::size_t oscillatorCount() const { return oscillators_.size(); }
    const std::vector<Bus>& outputs() const { return outputs_; }
    bool disconnected() const { return disconnected_; }

    void render(std::uint64_t blockStart, std::size_t frames, BusBuffers& buses) override;
    // Cancels automation from `when`, ramps from the current level to 0 over
    // 50 ms and stops the oscillators 100 ms after `when`.
    void stop(double when) override;
    std::uint64_t reclaimFrame() const override;
    std::size_t nodeCount() const override;
    void disconnect() override;

private:
    struct OscillatorNode {
        dsp::Oscillator oscillator;
        float gain = 1.0f;
    };

    std::uint64_t toFrame(double seconds) const;

    double sampleRate_;
    double startTime_;
    double oscStopTime_;
    double reclaimTime_;
    std::vector<OscillatorNode> oscillators_;
    dsp::FilterChain processors_;
    dsp::ParamTimeline envelope_;
    std::vector<Bus> outputs_;
    std::size_t nodeCount_ = 1;  // envelope gain
    bool disconnected_ = false;
};

// Caller-side reference to a scheduled source.
class VoiceHandle {
public:
    VoiceHandle() = default;
    VoiceHandle(EngineContext* context, std::uint64_t id, double startTime)
        : context_(context), id_(id), startTime_(startTime) {}

    // Early stop at `atTime` (context seconds), or now. No-op once reclaimed.
    void stop(std::optional<double> atTime = std::nullopt) const;
    bool isLive() const;

    std::uint64_t id() const { return id_; }
    double startTime() const { return startTime_; }

private:
    EngineContext* context_ = nullptr;
    std::uint64_t id_ = 0;
    double startTime_ = 0.0;
};

}  // namespace engine
