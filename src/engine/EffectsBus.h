#pragma once

#include <cstdint>
#include <mutex>

#include "dsp/ConvolutionReverb.h"
#include "dsp/FeedbackDelay.h"
#include "engine/EngineContext.h"
#include "engine/EngineParams.h"

namespace engine {

// Reverb and delay returns fed by the context's send buses. Registers itself
// with the context for its lifetime.
class EffectsBus : public SendProcessor {
public:
    static constexpr double kImpulseSeconds = 2.0;
    static constexpr double kImpulseDecay = 2.5;

    // irSeed == 0 draws the impulse-response noise from std::random_device.
    explicit EffectsBus(EngineContext& context,
                        const EffectSettings& initial = {},
                        std::uint32_t irSeed = 0);
    ~EffectsBus() override;

    EffectsBus(const EffectsBus&) = delete;
    EffectsBus& operator=(const EffectsBus&) = delete;

    // Merges the patch, clamps it against the parameter table and marks the
    // DSP parameters for re-derivation at the next block.
    void updateEffectSettings(EffectKind kind, const EffectPatch& patch);
    void applySettings(const EffectSettings& settings);
    EffectSettings settings() const;

    std::size_t impulseResponseLength() const { return impulseLength_; }

    void processSends(const BusBuffers& buses,
                      float* left,
                      float* right,
                      std::size_t frames) override;

private:
    void applyToDspUnlocked(const EffectSettings& settings);

    EngineContext& context_;
    mutable std::mutex mutex_;
    EffectSettings settings_;
    bool dirty_ = true;

    dsp::ConvolutionReverb reverb_;
    dsp::FeedbackDelay delay_;
    std::size_t impulseLength_ = 0;
};

}  // namespace engine
