#include "render/OfflineRenderer.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "dsp/Denormals.h"
#include "engine/DrumSampler.h"
#include "engine/EffectsBus.h"
#include "engine/EngineContext.h"
#include "engine/VoiceSynthesizer.h"

namespace render {

using engine::EngineError;

double ArrangementDuration(const engine::ArrangementConfig& config, double bpm) {
    return config.totalTicks() * engine::SecondsPerTick(bpm) + OfflineRenderer::kTailSeconds;
}

OfflineRenderer::OfflineRenderer() : OfflineRenderer(Options{}) {}

OfflineRenderer::OfflineRenderer(const Options& options, const engine::EffectsBus* liveEffects)
    : options_(options), liveEffects_(liveEffects) {
    if (options_.blockSize == 0) {
        options_.blockSize = 512;
    }
    if (options_.channels == 0) {
        options_.channels = 2;
    }
}

bool OfflineRenderer::fail(const std::string& message,
                           RenderedBuffer& out,
                           std::string& errorMessage) {
    lastError_ = EngineError::RenderFailure;
    errorMessage = message;
    out.frames = 0;
    out.samples.clear();
    return false;
}

bool OfflineRenderer::renderToBuffer(const std::vector<engine::NoteEvent>& events,
                                     const std::string& instrumentId,
                                     double bpm,
                                     double durationSec,
                                     RenderedBuffer& out,
                                     std::string& errorMessage) {
    RenderRequest request;
    request.notes = events;
    request.instrumentId = instrumentId;
    request.bpm = bpm;
    request.durationSec = durationSec;
    if (liveEffects_) {
        request.effects = liveEffects_->settings();
    }
    return renderToBuffer(request, out, errorMessage);
}

bool OfflineRenderer::renderToBuffer(const RenderRequest& request,
                                     RenderedBuffer& out,
                                     std::string& errorMessage) {
    errorMessage.clear();
    lastError_ = EngineError::None;

    if (!std::isfinite(request.durationSec) || request.durationSec <= 0.0) {
        return fail("render duration must be positive", out, errorMessage);
    }
    if (request.durationSec > kMaxDurationSeconds) {
        return fail("render duration exceeds 600 seconds", out, errorMessage);
    }
    if (!std::isfinite(request.bpm) || request.bpm <= 0.0) {
        return fail("bpm must be positive", out, errorMessage);
    }

    engine::EngineContext::Options contextOptions;
    contextOptions.sampleRate = options_.sampleRate;
    contextOptions.channels = options_.channels;
    contextOptions.masterGain = options_.masterGain;
    contextOptions.startRunning = true;
    engine::EngineContext context(contextOptions);

    engine::EffectsBus effects(context, engine::ClampEffectSettings(request.effects),
                               options_.impulseSeed);
    engine::VoiceSynthesizer synth(context, registry_, &effects);
    engine::DrumSampler drums(context, &effects);

    const double secondsPerTick = engine::SecondsPerTick(request.bpm);
    for (const auto& note : request.notes) {
        if (note.startTick < 0 || note.durationTicks < 1) {
            return fail("invalid note event", out, errorMessage);
        }
        const auto handle = synth.playNote(request.instrumentId, note.pitch,
                                           note.startTick * secondsPerTick,
                                           note.durationTicks * secondsPerTick,
                                           std::clamp(note.velocity, 0.0f, 1.0f));
        if (!handle) {
            return fail(std::string("note dispatch failed: ") + engine::ToString(synth.lastError()),
                        out, errorMessage);
        }
    }
    for (const auto& hit : request.drumHits) {
        if (hit.step < 0) {
            return fail("invalid drum hit", out, errorMessage);
        }
        const auto handle = drums.playDrum(hit.type, hit.step * secondsPerTick, hit.volume);
        if (!handle) {
            return fail(std::string("drum dispatch failed: ") + engine::ToString(drums.lastError()),
                        out, errorMessage);
        }
    }

    const auto totalFrames = static_cast<std::size_t>(std::ceil(request.durationSec * options_.sampleRate));
    const std::size_t channels = options_.channels;
    std::vector<float> samples(totalFrames * channels, 0.0f);

    dsp::ScopedDenormalsDisable denormals;
    std::size_t rendered = 0;
    while (rendered < totalFrames) {
        const std::size_t frames = std::min(options_.blockSize, totalFrames - rendered);
        engine::ProcessBlock block;
        block.output = samples.data() + rendered * channels;
        block.frames = frames;
        block.channels = options_.channels;
        context.process(block);
        rendered += frames;
    }

    const bool finite = std::all_of(samples.begin(), samples.end(),
                                    [](float sample) { return std::isfinite(sample); });
    if (!finite) {
        return fail("rendered output is not finite", out, errorMessage);
    }

    out.sampleRate = options_.sampleRate;
    out.channels = options_.channels;
    out.frames = totalFrames;
    out.samples = std::move(samples);
    return true;
}

}  // namespace render
