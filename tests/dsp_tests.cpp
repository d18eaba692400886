#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <complex>
#include <memory>
#include <string>
#include <vector>

#include "dsp/ConvolutionReverb.h"
#include "dsp/FeedbackDelay.h"
#include "dsp/Fft.h"
#include "dsp/Filter.h"
#include "dsp/ImpulseResponse.h"
#include "dsp/Oscillator.h"
#include "dsp/ParamTimeline.h"
#include "dsp/PartitionedConvolver.h"

namespace {

float rms(const std::vector<float>& buffer, std::size_t start = 0) {
    double sum = 0.0;
    std::size_t count = 0;
    for (std::size_t i = start; i < buffer.size(); ++i) {
        sum += static_cast<double>(buffer[i]) * buffer[i];
        ++count;
    }
    return count == 0 ? 0.0f : static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

std::vector<float> sineBlock(double frequency, double sampleRate, std::size_t frames) {
    dsp::Oscillator osc(dsp::Waveform::Sine, frequency, sampleRate);
    std::vector<float> out(frames);
    for (auto& s : out) {
        s = osc.next();
    }
    return out;
}

}  // namespace

TEST_CASE("FFT roundtrip preserves samples (approx)", "[dsp][fft]") {
    dsp::Fft fft(16);
    REQUIRE(dsp::Fft::isPowerOfTwo(16));
    REQUIRE_FALSE(dsp::Fft::isPowerOfTwo(12));

    std::vector<std::complex<float>> data(16);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = std::complex<float>(std::sin(static_cast<float>(i) * 0.7f), 0.0f);
    }
    auto freq = data;
    fft.forward(freq);
    fft.inverse(freq);
    for (std::size_t i = 0; i < data.size(); ++i) {
        REQUIRE(freq[i].real() == Catch::Approx(data[i].real()).margin(1e-4));
        REQUIRE(freq[i].imag() == Catch::Approx(0.0f).margin(1e-4));
    }
}

TEST_CASE("Partitioned convolver reproduces IR for impulse input", "[dsp][convolution]") {
    const std::size_t block = 8;
    const std::size_t fftSize = 16;

    const std::vector<float> ir = {1.0f, 0.5f, 0.25f, 0.0f, 0.0f, 0.1f, 0.0f, 0.0f,
                                   0.05f, 0.0f, 0.0f, 0.0f};
    const auto kernel = dsp::PartitionedConvolver::buildKernelFromIr(ir, block, fftSize);
    REQUIRE(kernel.partitions.size() == 2);

    dsp::PartitionedConvolver conv;
    conv.configure(block, fftSize, kernel.partitions.size());
    conv.reset();

    std::vector<float> in(block, 0.0f);
    in[0] = 1.0f;
    std::vector<float> out(block, 0.0f);
    std::vector<float> overlap(block, 0.0f);

    conv.pushInputBlock(in.data());
    conv.convolve(kernel, out.data(), overlap);
    for (std::size_t i = 0; i < block; ++i) {
        REQUIRE(out[i] == Catch::Approx(ir[i]).margin(1e-4));
    }

    std::fill(in.begin(), in.end(), 0.0f);
    conv.pushInputBlock(in.data());
    conv.convolve(kernel, out.data(), overlap);
    for (std::size_t i = 0; i < block; ++i) {
        const std::size_t irIdx = block + i;
        const float expected = irIdx < ir.size() ? ir[irIdx] : 0.0f;
        REQUIRE(out[i] == Catch::Approx(expected).margin(1e-4));
    }
}

TEST_CASE("ConvolutionReverb 湿声延迟一个块输出", "[dsp][reverb]") {
    const std::size_t block = 8;
    dsp::ConvolutionReverb reverb;
    reverb.configure(48000.0, block);

    dsp::ImpulseResponse ir;
    ir.sampleRate = 48000.0;
    ir.left = {1.0f};
    ir.right = {0.5f};
    reverb.setImpulseResponse(ir);
    reverb.setWetGain(1.0f);
    reverb.reset();

    std::vector<float> in(block * 3, 0.0f);
    in[0] = 1.0f;
    std::vector<float> left(in.size(), 0.0f);
    std::vector<float> right(in.size(), 0.0f);
    reverb.process(in.data(), left.data(), right.data(), in.size());

    for (std::size_t i = 0; i < block; ++i) {
        REQUIRE(left[i] == Catch::Approx(0.0f).margin(1e-6));
    }
    REQUIRE(left[block] == Catch::Approx(1.0f).margin(1e-4));
    REQUIRE(right[block] == Catch::Approx(0.5f).margin(1e-4));
    REQUIRE(left[block + 1] == Catch::Approx(0.0f).margin(1e-4));
}

TEST_CASE("ConvolutionReverb 湿声增益为 0 时不改变输出", "[dsp][reverb]") {
    dsp::ConvolutionReverb reverb;
    reverb.configure(44100.0, 64);
    reverb.setImpulseResponse(dsp::GenerateImpulseResponse(44100.0, 0.1, 2.5, 7));
    reverb.setWetGain(0.0f);
    reverb.reset();

    std::vector<float> in(512);
    for (std::size_t i = 0; i < in.size(); ++i) {
        in[i] = (i % 3 == 0) ? 0.3f : -0.2f;
    }
    std::vector<float> left(in.size(), 0.25f);
    std::vector<float> right(in.size(), -0.25f);
    reverb.process(in.data(), left.data(), right.data(), in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        REQUIRE(left[i] == Catch::Approx(0.25f).epsilon(1e-6));
        REQUIRE(right[i] == Catch::Approx(-0.25f).epsilon(1e-6));
    }
}

TEST_CASE("ConvolutionReverb 静音输入后进入空闲", "[dsp][reverb]") {
    dsp::ConvolutionReverb reverb;
    reverb.configure(44100.0, 32);
    reverb.setImpulseResponse(dsp::GenerateImpulseResponse(44100.0, 0.01, 2.5, 3));
    reverb.setWetGain(1.0f);
    reverb.reset();
    REQUIRE(reverb.idle());

    std::vector<float> in(32, 0.5f);
    std::vector<float> left(32, 0.0f);
    std::vector<float> right(32, 0.0f);
    reverb.process(in.data(), left.data(), right.data(), in.size());
    REQUIRE_FALSE(reverb.idle());

    std::fill(in.begin(), in.end(), 0.0f);
    for (int i = 0; i < 64; ++i) {
        reverb.process(in.data(), left.data(), right.data(), in.size());
    }
    REQUIRE(reverb.idle());
}

TEST_CASE("FeedbackDelay 按反馈系数重复回声", "[dsp][delay]") {
    dsp::FeedbackDelay delay;
    delay.configure(1000.0, 1.0);
    delay.setDelaySeconds(0.01);
    delay.setFeedback(0.5f);
    delay.setWetGain(1.0f);
    delay.reset();

    std::vector<float> in(40, 0.0f);
    in[0] = 1.0f;
    std::vector<float> left(in.size(), 0.0f);
    std::vector<float> right(in.size(), 0.0f);
    delay.process(in.data(), left.data(), right.data(), in.size());

    REQUIRE(left[0] == Catch::Approx(0.0f));
    REQUIRE(left[10] == Catch::Approx(1.0f));
    REQUIRE(left[20] == Catch::Approx(0.5f));
    REQUIRE(left[30] == Catch::Approx(0.25f));
    REQUIRE(right[10] == Catch::Approx(1.0f));
}

TEST_CASE("FeedbackDelay 参数钳制", "[dsp][delay]") {
    dsp::FeedbackDelay delay;
    delay.configure(44100.0);
    delay.setFeedback(1.5f);
    REQUIRE(delay.feedback() == Catch::Approx(0.99f));
    delay.setFeedback(-1.0f);
    REQUIRE(delay.feedback() == Catch::Approx(0.0f));
    delay.setDelaySeconds(5.0);
    REQUIRE(delay.delaySeconds() == Catch::Approx(dsp::FeedbackDelay::kMaxDelaySeconds));
}

TEST_CASE("ParamTimeline 线性与指数斜坡", "[dsp][timeline]") {
    dsp::ParamTimeline linear(0.25);
    REQUIRE(linear.valueAt(1.0) == Catch::Approx(0.25));

    linear.setValueAtTime(0.0, 1.0);
    linear.linearRampToValueAtTime(1.0, 2.0);
    REQUIRE(linear.valueAt(0.5) == Catch::Approx(0.25));
    REQUIRE(linear.valueAt(1.5) == Catch::Approx(0.5));
    REQUIRE(linear.valueAt(3.0) == Catch::Approx(1.0));
    REQUIRE(linear.endTime() == Catch::Approx(2.0));

    dsp::ParamTimeline exponential;
    exponential.setValueAtTime(1.0, 0.0);
    exponential.exponentialRampToValueAtTime(0.01, 1.0);
    REQUIRE(exponential.valueAt(0.5) == Catch::Approx(0.1));
    REQUIRE(exponential.valueAt(1.0) == Catch::Approx(0.01));
}

TEST_CASE("ParamTimeline cancelAndHold 保持当前值", "[dsp][timeline]") {
    dsp::ParamTimeline gain;
    gain.setValueAtTime(0.0, 0.0);
    gain.linearRampToValueAtTime(1.0, 1.0);
    gain.linearRampToValueAtTime(0.0, 2.0);

    gain.cancelAndHoldAtTime(0.5);
    REQUIRE(gain.events().size() == 2);
    REQUIRE(gain.valueAt(0.5) == Catch::Approx(0.5));
    REQUIRE(gain.valueAt(1.5) == Catch::Approx(0.5));

    gain.linearRampToValueAtTime(0.0, 0.75);
    REQUIRE(gain.valueAt(0.625) == Catch::Approx(0.25));

    gain.cancelScheduledValues(0.0);
    REQUIRE(gain.events().empty());
}

TEST_CASE("ParamTimeline 同一时刻的事件按插入顺序生效", "[dsp][timeline]") {
    dsp::ParamTimeline gain;
    gain.setValueAtTime(0.3, 1.0);
    gain.setValueAtTime(0.7, 1.0);
    REQUIRE(gain.valueAt(1.0) == Catch::Approx(0.7));

    std::vector<float> out(3, -1.0f);
    gain.fill(0.5, 0.5, out.data(), out.size());
    REQUIRE(out[0] == Catch::Approx(0.0f));
    REQUIRE(out[1] == Catch::Approx(0.7f));
    REQUIRE(out[2] == Catch::Approx(0.7f));
}

TEST_CASE("Oscillator 各波形保持在单位幅度附近", "[dsp][oscillator]") {
    for (auto waveform : {dsp::Waveform::Sine, dsp::Waveform::Square,
                          dsp::Waveform::Sawtooth, dsp::Waveform::Triangle}) {
        dsp::Oscillator osc(waveform, 440.0, 44100.0);
        float peak = 0.0f;
        for (int i = 0; i < 4410; ++i) {
            const float s = osc.next();
            REQUIRE(std::isfinite(s));
            peak = std::max(peak, std::abs(s));
        }
        INFO(dsp::ToString(waveform));
        REQUIRE(peak > 0.9f);
        REQUIRE(peak < 1.2f);
    }

    REQUIRE(dsp::WaveformFromName("saw") == dsp::Waveform::Sawtooth);
    REQUIRE_FALSE(dsp::WaveformFromName("noise").has_value());
}

TEST_CASE("Oscillator 正弦周期与频率一致", "[dsp][oscillator]") {
    const auto block = sineBlock(1000.0, 48000.0, 48);
    REQUIRE(block[0] == Catch::Approx(0.0f).margin(1e-6));
    REQUIRE(block[12] == Catch::Approx(1.0f).margin(1e-4));
    REQUIRE(block[36] == Catch::Approx(-1.0f).margin(1e-4));
}

TEST_CASE("BiquadFilter 低通衰减高频、高通保留高频", "[dsp][filter]") {
    const double sr = 44100.0;
    const auto high = sineBlock(10000.0, sr, 4096);

    dsp::BiquadFilter lowpass(dsp::FilterType::Lowpass, sr, 500.0, 0.707);
    dsp::BiquadFilter highpass(dsp::FilterType::Highpass, sr, 500.0, 0.707);
    std::vector<float> low(high.size());
    std::vector<float> passed(high.size());
    for (std::size_t i = 0; i < high.size(); ++i) {
        low[i] = lowpass.process(high[i]);
        passed[i] = highpass.process(high[i]);
    }
    REQUIRE(rms(low, 1024) < 0.05f * rms(high, 1024));
    REQUIRE(rms(passed, 1024) == Catch::Approx(rms(high, 1024)).epsilon(0.05));

    REQUIRE(dsp::FilterTypeFromName("bandpass") == dsp::FilterType::Bandpass);
    REQUIRE(std::string(dsp::ToString(dsp::FilterType::Highpass)) == "highpass");
}

TEST_CASE("Waveshaper 归一化软削波", "[dsp][filter]") {
    dsp::Waveshaper shaper(3.0f);
    REQUIRE(shaper.process(0.0f) == Catch::Approx(0.0f));
    REQUIRE(shaper.process(1.0f) == Catch::Approx(1.0f));
    REQUIRE(shaper.process(-1.0f) == Catch::Approx(-1.0f));
    REQUIRE(shaper.process(10.0f) < 1.01f);
    REQUIRE(shaper.process(0.2f) > 0.2f);

    dsp::FilterChain chain;
    REQUIRE(chain.empty());
    REQUIRE(chain.process(0.3f) == Catch::Approx(0.3f));
    chain.addFilter(std::make_unique<dsp::Waveshaper>(3.0f));
    chain.addFilter(nullptr);
    REQUIRE(chain.size() == 1);
    REQUIRE(chain.process(1.0f) == Catch::Approx(1.0f));
}

TEST_CASE("ImpulseResponse 指定种子时结果可复现并逐渐衰减", "[dsp][impulse]") {
    const auto a = dsp::GenerateImpulseResponse(8000.0, 2.0, 2.5, 42);
    const auto b = dsp::GenerateImpulseResponse(8000.0, 2.0, 2.5, 42);
    REQUIRE(a.length() == 16000);
    REQUIRE(a.right.size() == a.left.size());
    REQUIRE(a.left == b.left);
    REQUIRE(a.right == b.right);

    std::vector<float> head(a.left.begin(), a.left.begin() + 1600);
    std::vector<float> tail(a.left.end() - 1600, a.left.end());
    REQUIRE(rms(tail) < 0.01f * rms(head));

    REQUIRE(dsp::GenerateImpulseResponse(0.0).empty());
}
