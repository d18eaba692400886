#include "engine/EffectsBus.h"

namespace engine {

EffectsBus::EffectsBus(EngineContext& context,
                       const EffectSettings& initial,
                       std::uint32_t irSeed)
    : context_(context), settings_(ClampEffectSettings(initial)) {
    const double sampleRate = context_.sampleRate();
    const auto ir = dsp::GenerateImpulseResponse(sampleRate, kImpulseSeconds, kImpulseDecay, irSeed);
    impulseLength_ = ir.length();
    reverb_.configure(sampleRate);
    reverb_.setImpulseResponse(ir);
    delay_.configure(sampleRate, dsp::FeedbackDelay::kMaxDelaySeconds);

    applyToDspUnlocked(settings_);
    reverb_.reset();
    delay_.reset();
    dirty_ = false;

    context_.setSendProcessor(this);
}

EffectsBus::~EffectsBus() {
    context_.setSendProcessor(nullptr);
}

void EffectsBus::updateEffectSettings(EffectKind kind, const EffectPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = MergeEffectPatch(settings_, kind, patch);
    dirty_ = true;
}

void EffectsBus::applySettings(const EffectSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = ClampEffectSettings(settings);
    dirty_ = true;
}

EffectSettings EffectsBus::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void EffectsBus::applyToDspUnlocked(const EffectSettings& settings) {
    reverb_.setWetGain(ReverbWetGain(settings));
    delay_.setDelaySeconds(settings.delay.timeSec);
    delay_.setFeedback(settings.delay.feedback);
    delay_.setWetGain(DelayWetGain(settings));
}

void EffectsBus::processSends(const BusBuffers& buses,
                              float* left,
                              float* right,
                              std::size_t frames) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dirty_) {
            applyToDspUnlocked(settings_);
            dirty_ = false;
        }
    }
    reverb_.process(buses.data(Bus::ReverbSend), left, right, frames);
    delay_.process(buses.data(Bus::DelaySend), left, right, frames);
}

}  // namespace engine
