#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

#include "TestDoubles.h"
#include "engine/DrumSampler.h"
#include "engine/EffectsBus.h"
#include "engine/EngineContext.h"

namespace {

engine::EngineContext::Options runningOptions() {
    engine::EngineContext::Options options;
    options.startRunning = true;
    return options;
}

class BusEnergyProbe : public engine::SendProcessor {
public:
    void processSends(const engine::BusBuffers& buses,
                      float*,
                      float*,
                      std::size_t frames) override {
        for (std::size_t b = 0; b < engine::kBusCount; ++b) {
            const float* data = buses.data(static_cast<engine::Bus>(b));
            for (std::size_t i = 0; i < frames; ++i) {
                energy[b] += static_cast<double>(data[i]) * data[i];
            }
        }
    }

    double of(engine::Bus bus) const { return energy[static_cast<std::size_t>(bus)]; }

    std::array<double, engine::kBusCount> energy{};
};

float peak(const engine::SampleBuffer& buffer) {
    float p = 0.0f;
    for (float s : buffer) {
        p = std::max(p, std::abs(s));
    }
    return p;
}

}  // namespace

TEST_CASE("鼓组采样长度与峰值", "[engine][drums]") {
    const auto kit = engine::GenerateDrumKit(44100.0);
    REQUIRE(kit.sampleRate == Catch::Approx(44100.0));

    const std::array<std::pair<engine::DrumType, double>, 4> lengths = {{
        {engine::DrumType::Kick, 0.5},
        {engine::DrumType::Snare, 0.3},
        {engine::DrumType::HiHat, 0.15},
        {engine::DrumType::Clap, 0.3},
    }};
    for (const auto& [type, seconds] : lengths) {
        INFO(engine::ToString(type));
        const auto& buffer = kit.buffer(type);
        const auto expected = static_cast<long>(std::lround(seconds * 44100.0));
        REQUIRE(std::labs(static_cast<long>(buffer.size()) - expected) <= 1);
        REQUIRE(peak(buffer) == Catch::Approx(0.9f));
        for (float s : buffer) {
            REQUIRE(std::isfinite(s));
        }
        REQUIRE(std::abs(buffer.back()) < 0.05f);
    }
}

TEST_CASE("鼓组采样可复现", "[engine][drums]") {
    const auto a = engine::GenerateDrumKit(22050.0);
    const auto b = engine::GenerateDrumKit(22050.0);
    for (std::size_t i = 0; i < engine::kDrumTypeCount; ++i) {
        REQUIRE(*a.buffers[i] == *b.buffers[i]);
    }
}

TEST_CASE("鼓声进入鼓总线，混响开启时同时进入混响发送", "[engine][drums]") {
    engine::EngineContext context(runningOptions());
    engine::EffectsBus effects(context, {}, 5);
    engine::DrumSampler drums(context, &effects);

    BusEnergyProbe dryOnly;
    context.setSendProcessor(&dryOnly);
    REQUIRE(drums.playDrum(engine::DrumType::Snare, 0.0, 0.8f).has_value());
    fakes::RenderFor(context, 0.4);
    REQUIRE(dryOnly.of(engine::Bus::Drum) > 0.0);
    REQUIRE(dryOnly.of(engine::Bus::ReverbSend) == 0.0);
    REQUIRE(dryOnly.of(engine::Bus::Dry) == 0.0);

    engine::EffectPatch patch;
    patch.enabled = true;
    effects.updateEffectSettings(engine::EffectKind::Reverb, patch);

    BusEnergyProbe withReverb;
    context.setSendProcessor(&withReverb);
    REQUIRE(drums.playDrumPreview(engine::DrumType::Kick).has_value());
    fakes::RenderFor(context, 0.4);
    REQUIRE(withReverb.of(engine::Bus::Drum) > 0.0);
    REQUIRE(withReverb.of(engine::Bus::ReverbSend) == Catch::Approx(withReverb.of(engine::Bus::Drum)));
    REQUIRE(withReverb.of(engine::Bus::DelaySend) == 0.0);
    context.setSendProcessor(nullptr);
}

TEST_CASE("鼓声力度钳制并在结束后回收", "[engine][drums]") {
    engine::EngineContext context(runningOptions());
    engine::DrumSampler drums(context);

    const auto handle = drums.playDrum(engine::DrumType::Kick, std::nullopt, 4.0f);
    REQUIRE(handle.has_value());
    REQUIRE(context.liveNodeCount() == 2);

    const auto out = fakes::RenderFor(context, 0.55);
    REQUIRE(fakes::MaxAbs(out) <= 0.9f * 0.7f + 1e-4f);
    REQUIRE(fakes::MaxAbs(out) > 0.5f);
    REQUIRE(handle->isLive());

    fakes::RenderFor(context, 0.1);
    REQUIRE_FALSE(handle->isLive());
    REQUIRE(context.reclaimedNodeCount() == 2);
}

TEST_CASE("鼓声提前停止会截断缓冲", "[engine][drums]") {
    engine::EngineContext context(runningOptions());
    engine::DrumSampler drums(context);

    const auto handle = drums.playDrum(engine::DrumType::Clap, 0.0, 1.0f);
    REQUIRE(handle.has_value());
    handle->stop(0.05);
    const auto out = fakes::RenderFor(context, 0.2);
    const auto cut = static_cast<std::size_t>(0.05 * context.sampleRate()) * context.channels();
    REQUIRE(fakes::MaxAbs(out, 0, cut) > 0.0f);
    REQUIRE(fakes::MaxAbs(out, cut + context.channels()) == 0.0f);
    REQUIRE_FALSE(handle->isLive());
}

TEST_CASE("鼓声在引擎未运行时失败", "[engine][drums]") {
    engine::EngineContext context;
    engine::DrumSampler drums(context);
    REQUIRE_FALSE(drums.playDrumPreview(engine::DrumType::HiHat).has_value());
    REQUIRE(drums.lastError() == engine::EngineError::AudioContextUnavailable);
}

TEST_CASE("EffectsBus 合并补丁并提供一致快照", "[engine][effects]") {
    engine::EngineContext context;
    engine::EffectsBus effects(context, {}, 9);
    REQUIRE(effects.impulseResponseLength() == 88200);

    engine::EffectPatch patch;
    patch.enabled = true;
    patch.mix = 0.6f;
    patch.timeSec = 7.0f;
    patch.feedback = 1.2f;
    effects.updateEffectSettings(engine::EffectKind::Delay, patch);

    const auto settings = effects.settings();
    REQUIRE(settings.delay.enabled);
    REQUIRE(settings.delay.mix == Catch::Approx(0.6f));
    REQUIRE(settings.delay.timeSec == Catch::Approx(2.0f));
    REQUIRE(settings.delay.feedback == Catch::Approx(0.95f));
    REQUIRE_FALSE(settings.reverb.enabled);
    REQUIRE(settings.reverb.mix == Catch::Approx(0.3f));

    engine::EffectSettings replacement;
    replacement.reverb.enabled = true;
    replacement.reverb.mix = 2.0f;
    effects.applySettings(replacement);
    REQUIRE(effects.settings().reverb.mix == Catch::Approx(1.0f));
    REQUIRE_FALSE(effects.settings().delay.enabled);
}

TEST_CASE("EffectsBus 延迟发送产生回声，关闭后湿声归零", "[engine][effects]") {
    engine::EngineContext context;
    engine::EffectSettings initial;
    initial.delay.enabled = true;
    initial.delay.mix = 1.0f;
    initial.delay.timeSec = 0.01f;
    initial.delay.feedback = 0.0f;
    engine::EffectsBus effects(context, initial, 9);

    const std::size_t frames = 2048;
    engine::BusBuffers buses;
    buses.resize(frames);
    buses.clear();
    buses.data(engine::Bus::DelaySend)[0] = 1.0f;
    std::vector<float> left(frames, 0.0f);
    std::vector<float> right(frames, 0.0f);
    effects.processSends(buses, left.data(), right.data(), frames);

    const auto tap = static_cast<std::size_t>(std::lround(0.01f * 44100.0));
    REQUIRE(left[tap] == Catch::Approx(1.0f).epsilon(1e-4));
    REQUIRE(right[tap] == Catch::Approx(1.0f).epsilon(1e-4));
    REQUIRE(left[tap - 1] == Catch::Approx(0.0f).margin(1e-6));

    engine::EffectPatch off;
    off.enabled = false;
    effects.updateEffectSettings(engine::EffectKind::Delay, off);

    const std::size_t longFrames = 44100;
    buses.resize(longFrames);
    buses.clear();
    buses.data(engine::Bus::DelaySend)[longFrames / 2 - tap] = 1.0f;
    left.assign(longFrames, 0.0f);
    right.assign(longFrames, 0.0f);
    effects.processSends(buses, left.data(), right.data(), longFrames);
    REQUIRE(left[longFrames / 2] == Catch::Approx(0.0f).margin(1e-6));
}
