#include "engine/Voice.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "engine/InstrumentRegistry.h"

namespace engine {

EnvelopeSchedule ScheduleEnvelope(dsp::ParamTimeline& gain,
                                  const Envelope& envelope,
                                  double startTime,
                                  double durationSec,
                                  float velocity) {
    const double attack = std::max(0.0, envelope.attackSec);
    const double decay = std::max(0.0, envelope.decaySec);
    const double release = std::max(0.0, envelope.releaseSec);
    const double duration = std::max(0.0, durationSec);

    EnvelopeSchedule schedule;
    schedule.startTime = startTime;
    schedule.attackEnd = startTime + attack;
    schedule.decayEnd = schedule.attackEnd + decay;
    schedule.releaseStart = startTime + duration;
    schedule.releaseEnd = schedule.releaseStart + release;
    schedule.peakLevel = velocity;
    schedule.sustainLevel = std::clamp(envelope.sustainLevel, 0.0f, 1.0f) * velocity;

    const double peak = schedule.peakLevel;
    const double sustain = schedule.sustainLevel;

    if (attack > 0.0) {
        gain.setValueAtTime(0.0, startTime);
    }

    double releaseLevel = sustain;
    if (schedule.releaseStart <= schedule.attackEnd) {
        // Released during the attack.
        releaseLevel = attack > 0.0 ? peak * (duration / attack) : peak;
        if (attack > 0.0 && duration > 0.0) {
            gain.linearRampToValueAtTime(releaseLevel, schedule.releaseStart);
        } else {
            gain.setValueAtTime(releaseLevel, startTime);
        }
    } else {
        if (attack > 0.0) {
            gain.linearRampToValueAtTime(peak, schedule.attackEnd);
        } else {
            gain.setValueAtTime(peak, startTime);
        }
        if (schedule.releaseStart < schedule.decayEnd) {
            // Released during the decay.
            const double x = (schedule.releaseStart - schedule.attackEnd) / decay;
            releaseLevel = peak + (sustain - peak) * x;
            gain.linearRampToValueAtTime(releaseLevel, schedule.releaseStart);
        } else {
            if (decay > 0.0) {
                gain.linearRampToValueAtTime(sustain, schedule.decayEnd);
            } else {
                gain.setValueAtTime(sustain, schedule.attackEnd);
            }
            if (schedule.releaseStart > schedule.decayEnd) {
                gain.setValueAtTime(sustain, schedule.releaseStart);
            }
        }
    }
    schedule.releaseLevel = static_cast<float>(releaseLevel);

    if (release > 0.0) {
        gain.linearRampToValueAtTime(0.0, schedule.releaseEnd);
    } else {
        gain.setValueAtTime(0.0, schedule.releaseStart);
    }
    return schedule;
}

Voice::Voice(double sampleRate, double startTime)
    : sampleRate_(sampleRate > 0.0 ? sampleRate : 44100.0),
      startTime_(std::max(0.0, startTime)),
      oscStopTime_(std::numeric_limits<double>::infinity()),
      reclaimTime_(std::numeric_limits<double>::infinity()) {}

void Voice::addOscillator(dsp::Waveform waveform, double frequencyHz, float gain) {
    OscillatorNode node;
    node.oscillator.configure(waveform, frequencyHz, sampleRate_);
    node.gain = gain;
    oscillators_.push_back(node);
    nodeCount_ += 2;
}

void Voice::addProcessor(std::unique_ptr<dsp::Filter> processor) {
    if (!processor) {
        return;
    }
    processors_.addFilter(std::move(processor));
    ++nodeCount_;
}

void Voice::addOutput(Bus bus) {
    if (std::find(outputs_.begin(), outputs_.end(), bus) == outputs_.end()) {
        outputs_.push_back(bus);
    }
}

void Voice::setStopTimes(double oscillatorStopTime, double reclaimTime) {
    oscStopTime_ = oscillatorStopTime;
    reclaimTime_ = std::max(reclaimTime, oscillatorStopTime);
}

std::uint64_t Voice::toFrame(double seconds) const {
    if (!std::isfinite(seconds)) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    if (seconds <= 0.0) {
        return 0;
    }
    return static_cast<std::uint64_t>(std::llround(seconds * sampleRate_));
}

void Voice::render(std::uint64_t blockStart, std::size_t frames, BusBuffers& buses) {
    if (disconnected_ || outputs_.empty() || frames == 0) {
        return;
    }
    const std::uint64_t startFrame = toFrame(startTime_);
    const std::uint64_t stopFrame = toFrame(oscStopTime_);
    const std::uint64_t blockEnd = blockStart + frames;
    if (startFrame >= blockEnd || stopFrame <= blockStart) {
        return;
    }

    const std::uint64_t first = std::max(blockStart, startFrame);
    const std::uint64_t last = std::min(blockEnd, stopFrame);
    const double invRate = 1.0 / sampleRate_;
    for (std::uint64_t frame = first; frame < last; ++frame) {
        float sample = 0.0f;
        for (auto& node : oscillators_) {
            sample += node.oscillator.next() * node.gain;
        }
        sample = processors_.process(sample);
        sample *= static_cast<float>(envelope_.valueAt(static_cast<double>(frame) * invRate));

        const auto index = static_cast<std::size_t>(frame - blockStart);
        for (Bus bus : outputs_) {
            buses.data(bus)[index] += sample;
        }
    }
}

void Voice::stop(double when) {
    if (disconnected_) {
        return;
    }
    const double at = std::max(0.0, when);
    envelope_.cancelAndHoldAtTime(at);
    envelope_.linearRampToValueAtTime(0.0, at + kStopRampSeconds);
    const double stopAt = at + kOscillatorStopMargin;
    if (stopAt < oscStopTime_) {
        oscStopTime_ = stopAt;
        reclaimTime_ = std::min(reclaimTime_, oscStopTime_ + (kReclaimMargin - kOscillatorStopMargin));
    }
}

std::uint64_t Voice::reclaimFrame() const {
    return toFrame(reclaimTime_);
}

std::size_t Voice::nodeCount() const {
    return nodeCount_;
}

void Voice::disconnect() {
    if (disconnected_) {
        return;
    }
    disconnected_ = true;
    oscillators_.clear();
    processors_.clear();
    outputs_.clear();
}

void VoiceHandle::stop(std::optional<double> atTime) const {
    if (!context_ || id_ == 0) {
        return;
    }
    context_->stopSource(id_, atTime.value_or(context_->currentTime()));
}

bool VoiceHandle::isLive() const {
    return context_ && id_ != 0 && context_->isSourceLive(id_);
}

}  // namespace engine
