#include "engine/DrumSampler.h"

#include <algorithm>
#include <cmath>
#include <random>

#include "dsp/Filter.h"
#include "dsp/Oscillator.h"
#include "dsp/ParamTimeline.h"
#include "engine/EffectsBus.h"

namespace engine {

namespace {
constexpr double kTwoPi = 6.28318530717958647692;
constexpr std::uint32_t kNoiseSeed = 0x5eed808u;
constexpr float kPeakLevel = 0.9f;
constexpr double kReclaimMargin = 0.1;

std::size_t FrameCount(double sampleRate, double seconds) {
    return static_cast<std::size_t>(std::ceil(sampleRate * seconds));
}

void NormalizePeak(SampleBuffer& buffer) {
    float peak = 0.0f;
    for (float s : buffer) {
        peak = std::max(peak, std::fabs(s));
    }
    if (peak <= 0.0f) {
        return;
    }
    const float gain = kPeakLevel / peak;
    for (float& s : buffer) {
        s *= gain;
    }
}

SampleBuffer RenderKick(double sampleRate) {
    SampleBuffer out(FrameCount(sampleRate, 0.5));
    dsp::ParamTimeline frequency(150.0);
    frequency.setValueAtTime(150.0, 0.0);
    frequency.exponentialRampToValueAtTime(45.0, 0.12);
    dsp::ParamTimeline amp(1.0);
    amp.setValueAtTime(1.0, 0.0);
    amp.exponentialRampToValueAtTime(0.001, 0.5);

    double phase = 0.0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        out[i] = static_cast<float>(std::sin(kTwoPi * phase) * amp.valueAt(t));
        phase += frequency.valueAt(t) / sampleRate;
        phase -= std::floor(phase);
    }
    return out;
}

SampleBuffer RenderSnare(double sampleRate, std::mt19937& rng) {
    SampleBuffer out(FrameCount(sampleRate, 0.3));
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
    dsp::Oscillator tone(dsp::Waveform::Sine, 180.0, sampleRate);
    dsp::BiquadFilter highpass(dsp::FilterType::Highpass, sampleRate, 1000.0, 0.707);
    dsp::ParamTimeline toneAmp(0.7);
    toneAmp.setValueAtTime(0.7, 0.0);
    toneAmp.exponentialRampToValueAtTime(0.001, 0.1);
    dsp::ParamTimeline noiseAmp(1.0);
    noiseAmp.setValueAtTime(1.0, 0.0);
    noiseAmp.exponentialRampToValueAtTime(0.001, 0.3);

    for (std::size_t i = 0; i < out.size(); ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        const float body = tone.next() * static_cast<float>(toneAmp.valueAt(t));
        const float snap = highpass.process(noise(rng)) * static_cast<float>(noiseAmp.valueAt(t));
        out[i] = body + 0.8f * snap;
    }
    return out;
}

SampleBuffer RenderHiHat(double sampleRate, std::mt19937& rng) {
    static constexpr std::array<double, 6> kRatios = {2.0, 3.0, 4.16, 5.43, 6.79, 8.21};
    constexpr double kFundamental = 40.0;

    SampleBuffer out(FrameCount(sampleRate, 0.15));
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
    std::vector<dsp::Oscillator> cluster;
    for (double ratio : kRatios) {
        cluster.emplace_back(dsp::Waveform::Square, kFundamental * ratio, sampleRate);
    }
    dsp::BiquadFilter highpass(dsp::FilterType::Highpass, sampleRate, 7000.0, 0.707);
    dsp::ParamTimeline amp(1.0);
    amp.setValueAtTime(1.0, 0.0);
    amp.exponentialRampToValueAtTime(0.001, 0.15);

    const float clusterScale = 1.0f / static_cast<float>(kRatios.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        float metal = 0.0f;
        for (auto& osc : cluster) {
            metal += osc.next();
        }
        const float mixed = 0.5f * noise(rng) + 0.5f * metal * clusterScale;
        out[i] = highpass.process(mixed) * static_cast<float>(amp.valueAt(t));
    }
    return out;
}

SampleBuffer RenderClap(double sampleRate, std::mt19937& rng) {
    SampleBuffer out(FrameCount(sampleRate, 0.3));
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
    dsp::BiquadFilter bandpass(dsp::FilterType::Bandpass, sampleRate, 1500.0, 1.5);

    dsp::ParamTimeline amp(0.0);
    for (int burst = 0; burst < 4; ++burst) {
        const double at = 0.010 * burst;
        amp.setValueAtTime(1.0, at);
        amp.exponentialRampToValueAtTime(burst < 3 ? 0.1 : 0.5, at + 0.010);
    }
    amp.exponentialRampToValueAtTime(0.001, 0.3);

    for (std::size_t i = 0; i < out.size(); ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        out[i] = bandpass.process(noise(rng)) * static_cast<float>(amp.valueAt(t));
    }
    return out;
}

// One-shot playback of a shared buffer through a gain node.
class BufferSource : public Source {
public:
    BufferSource(std::shared_ptr<const SampleBuffer> buffer,
                 double sampleRate,
                 double startTime,
                 float gain)
        : buffer_(std::move(buffer)),
          sampleRate_(sampleRate),
          startFrame_(ToFrame(startTime, sampleRate)),
          endFrame_(startFrame_ + buffer_->size()),
          gain_(gain) {}

    void addOutput(Bus bus) { outputs_.push_back(bus); }

    void render(std::uint64_t blockStart, std::size_t frames, BusBuffers& buses) override {
        if (!buffer_ || outputs_.empty()) {
            return;
        }
        const std::uint64_t blockEnd = blockStart + frames;
        const std::uint64_t first = std::max(blockStart, startFrame_);
        const std::uint64_t last = std::min(blockEnd, endFrame_);
        for (std::uint64_t frame = first; frame < last; ++frame) {
            const float sample = (*buffer_)[static_cast<std::size_t>(frame - startFrame_)] * gain_;
            const auto index = static_cast<std::size_t>(frame - blockStart);
            for (Bus bus : outputs_) {
                buses.data(bus)[index] += sample;
            }
        }
    }

    void stop(double when) override {
        endFrame_ = std::min(endFrame_, std::max(startFrame_, ToFrame(when, sampleRate_)));
    }

    std::uint64_t reclaimFrame() const override {
        return endFrame_ + ToFrame(kReclaimMargin, sampleRate_);
    }

    std::size_t nodeCount() const override { return 2; }

    void disconnect() override {
        buffer_.reset();
        outputs_.clear();
    }

private:
    static std::uint64_t ToFrame(double seconds, double sampleRate) {
        if (!(seconds > 0.0)) {
            return 0;
        }
        return static_cast<std::uint64_t>(std::llround(seconds * sampleRate));
    }

    std::shared_ptr<const SampleBuffer> buffer_;
    double sampleRate_;
    std::uint64_t startFrame_;
    std::uint64_t endFrame_;
    float gain_;
    std::vector<Bus> outputs_;
};

}  // namespace

DrumKit GenerateDrumKit(double sampleRate) {
    DrumKit kit;
    if (sampleRate <= 0.0) {
        sampleRate = 44100.0;
    }
    kit.sampleRate = sampleRate;
    std::mt19937 rng(kNoiseSeed);

    auto store = [&kit](DrumType type, SampleBuffer buffer) {
        NormalizePeak(buffer);
        kit.buffers[static_cast<std::size_t>(type)] =
            std::make_shared<const SampleBuffer>(std::move(buffer));
    };
    store(DrumType::Kick, RenderKick(sampleRate));
    store(DrumType::Snare, RenderSnare(sampleRate, rng));
    store(DrumType::HiHat, RenderHiHat(sampleRate, rng));
    store(DrumType::Clap, RenderClap(sampleRate, rng));
    return kit;
}

DrumSampler::DrumSampler(EngineContext& context, const EffectsBus* effects)
    : context_(context), effects_(effects), kit_(GenerateDrumKit(context.sampleRate())) {}

std::optional<VoiceHandle> DrumSampler::playDrum(DrumType type,
                                                 std::optional<double> startTime,
                                                 float velocity) {
    if (!context_.isRunning()) {
        lastError_.store(EngineError::AudioContextUnavailable);
        return std::nullopt;
    }
    lastError_.store(EngineError::None);

    const double start = std::max(0.0, startTime.value_or(context_.currentTime()));
    auto source = std::make_unique<BufferSource>(kit_.buffers[static_cast<std::size_t>(type)],
                                                 context_.sampleRate(), start,
                                                 std::clamp(velocity, 0.0f, 1.0f));
    source->addOutput(Bus::Drum);
    if (effects_ && effects_->settings().reverb.enabled) {
        source->addOutput(Bus::ReverbSend);
    }
    const auto id = context_.addSource(std::move(source));
    return VoiceHandle(&context_, id, start);
}

std::optional<VoiceHandle> DrumSampler::playDrumPreview(DrumType type) {
    return playDrum(type, std::nullopt, kPreviewVelocity);
}

}  // namespace engine
