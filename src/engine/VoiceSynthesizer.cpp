#include "engine/VoiceSynthesizer.h"

#include <algorithm>
#include <cmath>

#include "engine/EffectsBus.h"
#include "engine/Pitch.h"

namespace engine {

namespace {
constexpr float kDistortionDrive = 3.0f;
}  // namespace

std::unique_ptr<Voice> BuildVoice(const InstrumentDefinition& instrument,
                                  const NoteRequest& request,
                                  const EffectSettings& effects,
                                  double sampleRate,
                                  EnvelopeSchedule* scheduleOut) {
    auto voice = std::make_unique<Voice>(sampleRate, request.startTime);
    const double baseFrequency = MidiNoteToFrequency(request.pitch);
    for (const auto& spec : instrument.oscillators) {
        voice->addOscillator(spec.waveform, baseFrequency * DetuneRatio(spec.detuneCents),
                             spec.relativeGain * request.velocity);
    }
    if (instrument.filter) {
        voice->addProcessor(std::make_unique<dsp::BiquadFilter>(
            instrument.filter->type, sampleRate, instrument.filter->cutoffHz, instrument.filter->q));
    }
    if (instrument.distortion) {
        voice->addProcessor(std::make_unique<dsp::Waveshaper>(kDistortionDrive));
    }

    const auto schedule = ScheduleEnvelope(voice->envelope(), instrument.envelope,
                                           voice->startTime(), request.durationSec,
                                           request.velocity);
    voice->setStopTimes(schedule.releaseEnd + Voice::kOscillatorStopMargin,
                        schedule.releaseEnd + Voice::kReclaimMargin);

    voice->addOutput(Bus::Dry);
    if (effects.reverb.enabled) {
        voice->addOutput(Bus::ReverbSend);
    }
    if (effects.delay.enabled) {
        voice->addOutput(Bus::DelaySend);
    }
    if (scheduleOut) {
        *scheduleOut = schedule;
    }
    return voice;
}

VoiceSynthesizer::VoiceSynthesizer(EngineContext& context,
                                   const InstrumentRegistry& registry,
                                   const EffectsBus* effects)
    : context_(context), registry_(registry), effects_(effects) {}

bool VoiceSynthesizer::ensureRunning() {
    if (!context_.isRunning()) {
        lastError_.store(EngineError::AudioContextUnavailable);
        return false;
    }
    lastError_.store(EngineError::None);
    return true;
}

std::optional<VoiceHandle> VoiceSynthesizer::playNote(std::string_view instrumentId,
                                                      int pitch,
                                                      std::optional<double> startTime,
                                                      double durationSec,
                                                      float velocity) {
    if (!ensureRunning()) {
        return std::nullopt;
    }
    if (!std::isfinite(durationSec) || (startTime && !std::isfinite(*startTime))) {
        return std::nullopt;
    }

    NoteRequest request;
    request.pitch = pitch;
    request.startTime = startTime.value_or(context_.currentTime());
    request.durationSec = std::max(0.0, durationSec);
    request.velocity = velocity;

    const EffectSettings effects = effects_ ? effects_->settings() : EffectSettings{};
    auto voice = BuildVoice(registry_.find(instrumentId), request, effects, context_.sampleRate());
    const double voiceStart = voice->startTime();
    const auto id = context_.addSource(std::move(voice));
    return VoiceHandle(&context_, id, voiceStart);
}

std::optional<VoiceHandle> VoiceSynthesizer::playPreviewNote(std::string_view instrumentId,
                                                             int pitch) {
    return playNote(instrumentId, pitch, std::nullopt, kPreviewDurationSec, kPreviewVelocity);
}

std::optional<VoiceHandle> VoiceSynthesizer::playMetronomeClick(double startTime, bool isDownbeat) {
    if (!ensureRunning()) {
        return std::nullopt;
    }
    auto voice = std::make_unique<Voice>(context_.sampleRate(), startTime);
    const double start = voice->startTime();
    voice->addOscillator(dsp::Waveform::Sine,
                         isDownbeat ? kDownbeatClickFrequencyHz : kClickFrequencyHz, 1.0f);
    voice->envelope().setValueAtTime(kClickGain, start);
    voice->envelope().exponentialRampToValueAtTime(kClickFloor, start + kClickDecaySec);
    voice->setStopTimes(start + Voice::kOscillatorStopMargin, start + Voice::kReclaimMargin);
    voice->addOutput(Bus::Metronome);

    const auto id = context_.addSource(std::move(voice));
    return VoiceHandle(&context_, id, start);
}

}  // namespace engine
