#include "dsp/ImpulseResponse.h"

#include <algorithm>
#include <cmath>
#include <random>

#include "dsp/Filter.h"

namespace dsp {

namespace {
constexpr double kGainCalibration = 0.00125;
constexpr double kCalibrationSampleRate = 44100.0;
constexpr double kMinPower = 0.000125;
constexpr double kToneCutoffHz = 6000.0;

float ComputeOnePoleAlpha(double sampleRate, double cutoffHz) {
    if (sampleRate <= 0.0 || cutoffHz <= 0.0) {
        return 1.0f;
    }
    const double x = std::exp(-2.0 * 3.14159265358979323846 * cutoffHz / sampleRate);
    return static_cast<float>(std::clamp(1.0 - x, 0.0, 1.0));
}

void FillChannel(std::vector<float>& channel,
                 std::size_t length,
                 double decay,
                 float alpha,
                 std::mt19937& rng) {
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
    OnePoleLowPass tone(alpha);
    channel.resize(length);
    const double n = static_cast<double>(length);
    for (std::size_t i = 0; i < length; ++i) {
        const double envelope = std::pow(1.0 - static_cast<double>(i) / n, decay);
        channel[i] = tone.process(noise(rng)) * static_cast<float>(envelope);
    }
}
}  // namespace

ImpulseResponse GenerateImpulseResponse(double sampleRate,
                                        double durationSeconds,
                                        double decay,
                                        std::uint32_t seed) {
    ImpulseResponse ir;
    if (sampleRate <= 0.0 || durationSeconds <= 0.0) {
        return ir;
    }
    ir.sampleRate = sampleRate;
    const auto length = static_cast<std::size_t>(sampleRate * durationSeconds);
    if (length == 0) {
        return ir;
    }

    std::mt19937 rng(seed != 0 ? seed : std::random_device{}());
    const float alpha = ComputeOnePoleAlpha(sampleRate, kToneCutoffHz);
    FillChannel(ir.left, length, decay, alpha, rng);
    FillChannel(ir.right, length, decay, alpha, rng);
    NormalizeImpulseResponse(ir);
    return ir;
}

void NormalizeImpulseResponse(ImpulseResponse& ir) {
    if (ir.empty()) {
        return;
    }
    const std::size_t channels = ir.right.empty() ? 1 : 2;
    double power = 0.0;
    for (float s : ir.left) {
        power += static_cast<double>(s) * s;
    }
    for (float s : ir.right) {
        power += static_cast<double>(s) * s;
    }
    power = std::sqrt(power / static_cast<double>(channels * ir.length()));
    if (!std::isfinite(power) || power < kMinPower) {
        power = kMinPower;
    }

    double scale = kGainCalibration / power;
    if (ir.sampleRate > 0.0) {
        scale *= kCalibrationSampleRate / ir.sampleRate;
    }
    const auto gain = static_cast<float>(scale);
    for (float& s : ir.left) {
        s *= gain;
    }
    for (float& s : ir.right) {
        s *= gain;
    }
}

}  // namespace dsp
