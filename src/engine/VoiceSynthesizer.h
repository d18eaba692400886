#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>

#include "engine/EngineContext.h"
#include "engine/EngineParams.h"
#include "engine/InstrumentRegistry.h"
#include "engine/Voice.h"

namespace engine {

class EffectsBus;

struct NoteRequest {
    int pitch = 60;
    double startTime = 0.0;
    double durationSec = 0.5;
    float velocity = 0.8f;
};

// Interprets an instrument definition into a voice graph: one gain-scaled
// oscillator per OscillatorSpec, then the optional filter and distortion, then the
// envelope gain. Outputs are chosen once from `effects`.
std::unique_ptr<Voice> BuildVoice(const InstrumentDefinition& instrument,
                                  const NoteRequest& request,
                                  const EffectSettings& effects,
                                  double sampleRate,
                                  EnvelopeSchedule* scheduleOut = nullptr);

class VoiceSynthesizer {
public:
    static constexpr double kPreviewDurationSec = 0.2;
    static constexpr float kPreviewVelocity = 0.6f;
    static constexpr double kClickFrequencyHz = 800.0;
    static constexpr double kDownbeatClickFrequencyHz = 1000.0;
    static constexpr float kClickGain = 0.5f;
    static constexpr float kClickFloor = 0.01f;
    static constexpr double kClickDecaySec = 0.03;

    VoiceSynthesizer(EngineContext& context,
                     const InstrumentRegistry& registry,
                     const EffectsBus* effects = nullptr);

    // startTime is context seconds; nullopt plays now. Unknown instruments
    // fall back to the registry default. Returns nullopt and sets lastError()
    // to AudioContextUnavailable when the context is not running.
    std::optional<VoiceHandle> playNote(std::string_view instrumentId,
                                        int pitch,
                                        std::optional<double> startTime,
                                        double durationSec,
                                        float velocity);
    std::optional<VoiceHandle> playPreviewNote(std::string_view instrumentId, int pitch);
    std::optional<VoiceHandle> playMetronomeClick(double startTime, bool isDownbeat);

    EngineError lastError() const { return lastError_.load(); }
    EngineContext& context() { return context_; }

private:
    bool ensureRunning();

    EngineContext& context_;
    const InstrumentRegistry& registry_;
    const EffectsBus* effects_;
    std::atomic<EngineError> lastError_{EngineError::None};
};

}  // namespace engine
