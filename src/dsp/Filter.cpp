#include "dsp/Filter.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
constexpr double kPi = 3.14159265358979323846;

float clamp01(float value) {
    return std::max(0.0f, std::min(1.0f, value));
}
}  // namespace

std::optional<FilterType> FilterTypeFromName(std::string_view name) {
    if (name == "lowpass") {
        return FilterType::Lowpass;
    }
    if (name == "highpass") {
        return FilterType::Highpass;
    }
    if (name == "bandpass") {
        return FilterType::Bandpass;
    }
    return std::nullopt;
}

const char* ToString(FilterType type) {
    switch (type) {
        case FilterType::Lowpass:
            return "lowpass";
        case FilterType::Highpass:
            return "highpass";
        case FilterType::Bandpass:
            return "bandpass";
    }
    return "lowpass";
}

OnePoleLowPass::OnePoleLowPass(float alpha)
    : alpha_(clamp01(alpha)), state_(0.0f) {}

void OnePoleLowPass::setAlpha(float alpha) {
    alpha_ = clamp01(alpha);
}

float OnePoleLowPass::process(float input) {
    state_ = alpha_ * input + (1.0f - alpha_) * state_;
    return state_;
}

void OnePoleLowPass::reset() {
    state_ = 0.0f;
}

BiquadFilter::BiquadFilter(FilterType type, double sampleRate, double cutoffHz, double q) {
    configure(type, sampleRate, cutoffHz, q);
}

void BiquadFilter::configure(FilterType type, double sampleRate, double cutoffHz, double q) {
    type_ = type;
    if (sampleRate <= 0.0) {
        return;
    }
    const double nyquist = 0.5 * sampleRate;
    cutoffHz_ = std::clamp(cutoffHz, 10.0, nyquist * 0.99);
    const double safeQ = std::max(q, 1.0e-4);

    const double w0 = 2.0 * kPi * cutoffHz_ / sampleRate;
    const double cw = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * safeQ);

    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    switch (type_) {
        case FilterType::Lowpass:
            b0 = (1.0 - cw) * 0.5;
            b1 = 1.0 - cw;
            b2 = (1.0 - cw) * 0.5;
            break;
        case FilterType::Highpass:
            b0 = (1.0 + cw) * 0.5;
            b1 = -(1.0 + cw);
            b2 = (1.0 + cw) * 0.5;
            break;
        case FilterType::Bandpass:
            b0 = alpha;
            b1 = 0.0;
            b2 = -alpha;
            break;
    }
    const double a0 = 1.0 + alpha;
    b0_ = static_cast<float>(b0 / a0);
    b1_ = static_cast<float>(b1 / a0);
    b2_ = static_cast<float>(b2 / a0);
    a1_ = static_cast<float>((-2.0 * cw) / a0);
    a2_ = static_cast<float>((1.0 - alpha) / a0);
}

float BiquadFilter::process(float input) {
    const float y = b0_ * input + z1_;
    z1_ = b1_ * input - a1_ * y + z2_;
    z2_ = b2_ * input - a2_ * y;
    return y;
}

void BiquadFilter::reset() {
    z1_ = 0.0f;
    z2_ = 0.0f;
}

Waveshaper::Waveshaper(float drive)
    : drive_(std::max(0.1f, drive)), norm_(1.0f / std::tanh(std::max(0.1f, drive))) {}

float Waveshaper::process(float input) {
    return std::tanh(drive_ * input) * norm_;
}

void FilterChain::addFilter(std::unique_ptr<Filter> filter) {
    if (filter) {
        filters_.emplace_back(std::move(filter));
    }
}

void FilterChain::clear() {
    filters_.clear();
}

void FilterChain::reset() {
    for (auto& filter : filters_) {
        filter->reset();
    }
}

bool FilterChain::empty() const {
    return filters_.empty();
}

float FilterChain::process(float input) {
    float value = input;
    for (auto& filter : filters_) {
        value = filter->process(value);
    }
    return value;
}

}  // namespace dsp
