#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "engine/EngineContext.h"
#include "engine/EngineTypes.h"
#include "engine/Voice.h"

namespace engine {

class EffectsBus;

using SampleBuffer = std::vector<float>;

// The four one-shot percussion buffers for one sample rate.
struct DrumKit {
    double sampleRate = 0.0;
    std::array<std::shared_ptr<const SampleBuffer>, kDrumTypeCount> buffers;

    const SampleBuffer& buffer(DrumType type) const {
        return *buffers[static_cast<std::size_t>(type)];
    }
};

// kick   0.50 s sine swept 150 -> 45 Hz, exponential decay
// snare  0.30 s 180 Hz tone + high-passed noise
// hihat  0.15 s high-passed noise + square cluster
// clap   0.30 s band-passed noise, bursts at 0/10/20/30 ms, tail from 40 ms
DrumKit GenerateDrumKit(double sampleRate);

class DrumSampler {
public:
    static constexpr float kPreviewVelocity = 0.8f;

    DrumSampler(EngineContext& context, const EffectsBus* effects = nullptr);

    // startTime is context seconds; nullopt plays now. Routed to the drum bus,
    // plus the reverb send while reverb is enabled.
    std::optional<VoiceHandle> playDrum(DrumType type,
                                        std::optional<double> startTime,
                                        float velocity);
    std::optional<VoiceHandle> playDrumPreview(DrumType type);

    const DrumKit& kit() const { return kit_; }
    EngineError lastError() const { return lastError_.load(); }

private:
    EngineContext& context_;
    const EffectsBus* effects_;
    DrumKit kit_;
    std::atomic<EngineError> lastError_{EngineError::None};
};

}  // namespace engine
