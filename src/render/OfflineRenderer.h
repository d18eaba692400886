#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "engine/EngineParams.h"
#include "engine/EngineTypes.h"
#include "engine/InstrumentRegistry.h"

namespace engine {
class EffectsBus;
}  // namespace engine

namespace render {

struct RenderRequest {
    std::vector<engine::NoteEvent> notes;
    std::vector<engine::DrumHit> drumHits;
    std::string instrumentId = engine::InstrumentRegistry::kDefaultInstrumentId;
    double bpm = 120.0;
    double durationSec = 0.0;
    engine::EffectSettings effects;
};

struct RenderedBuffer {
    double sampleRate = 44100.0;
    uint16_t channels = 2;
    std::size_t frames = 0;
    std::vector<float> samples;  // interleaved
};

// Arrangement length plus the release/reverb tail.
double ArrangementDuration(const engine::ArrangementConfig& config, double bpm);

// Renders a whole arrangement synchronously on a private engine context.
// Every render of the same request has the same length and envelope shape.
class OfflineRenderer {
public:
    static constexpr double kTailSeconds = 2.0;
    static constexpr double kMaxDurationSeconds = 600.0;

    struct Options {
        double sampleRate = 44100.0;
        uint16_t channels = 2;
        float masterGain = 0.8f;
        std::size_t blockSize = 512;
        // Impulse-response noise seed; 0 draws a new one per render.
        std::uint32_t impulseSeed = 0x2eb1;
    };

    OfflineRenderer();
    // `liveEffects` is the realtime bus whose settings the event-list overload
    // snapshots at render start; without one that overload renders dry.
    explicit OfflineRenderer(const Options& options,
                             const engine::EffectsBus* liveEffects = nullptr);

    // On failure `out` is left empty and lastError() is RenderFailure.
    bool renderToBuffer(const RenderRequest& request,
                        RenderedBuffer& out,
                        std::string& errorMessage);

    bool renderToBuffer(const std::vector<engine::NoteEvent>& events,
                        const std::string& instrumentId,
                        double bpm,
                        double durationSec,
                        RenderedBuffer& out,
                        std::string& errorMessage);

    const Options& options() const { return options_; }
    engine::EngineError lastError() const { return lastError_; }

private:
    bool fail(const std::string& message, RenderedBuffer& out, std::string& errorMessage);

    Options options_;
    const engine::EffectsBus* liveEffects_;
    engine::InstrumentRegistry registry_;
    engine::EngineError lastError_ = engine::EngineError::None;
};

}  // namespace render
