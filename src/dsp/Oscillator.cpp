#include "dsp/Oscillator.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
constexpr double kTwoPi = 6.28318530717958647692;

// Polynomial band-limited step correction around a discontinuity at phase 0.
double PolyBlep(double t, double dt) {
    if (dt <= 0.0) {
        return 0.0;
    }
    if (t < dt) {
        t /= dt;
        return t + t - t * t - 1.0;
    }
    if (t > 1.0 - dt) {
        t = (t - 1.0) / dt;
        return t * t + t + t + 1.0;
    }
    return 0.0;
}
}  // namespace

std::optional<Waveform> WaveformFromName(std::string_view name) {
    if (name == "sine") {
        return Waveform::Sine;
    }
    if (name == "square") {
        return Waveform::Square;
    }
    if (name == "sawtooth" || name == "saw") {
        return Waveform::Sawtooth;
    }
    if (name == "triangle") {
        return Waveform::Triangle;
    }
    return std::nullopt;
}

const char* ToString(Waveform waveform) {
    switch (waveform) {
        case Waveform::Sine:
            return "sine";
        case Waveform::Square:
            return "square";
        case Waveform::Sawtooth:
            return "sawtooth";
        case Waveform::Triangle:
            return "triangle";
    }
    return "sine";
}

Oscillator::Oscillator(Waveform waveform, double frequencyHz, double sampleRate) {
    configure(waveform, frequencyHz, sampleRate);
}

void Oscillator::configure(Waveform waveform, double frequencyHz, double sampleRate) {
    waveform_ = waveform;
    if (sampleRate > 0.0) {
        sampleRate_ = sampleRate;
    }
    setFrequency(frequencyHz);
    reset();
}

void Oscillator::setFrequency(double frequencyHz) {
    const double nyquist = 0.5 * sampleRate_;
    frequency_ = std::clamp(frequencyHz, 0.0, nyquist);
    increment_ = frequency_ / sampleRate_;
}

void Oscillator::reset(double phase) {
    phase_ = phase - std::floor(phase);
}

float Oscillator::next() {
    double value = 0.0;
    switch (waveform_) {
        case Waveform::Sine:
            value = std::sin(kTwoPi * phase_);
            break;
        case Waveform::Square: {
            value = phase_ < 0.5 ? 1.0 : -1.0;
            double shifted = phase_ + 0.5;
            shifted -= std::floor(shifted);
            value += PolyBlep(phase_, increment_);
            value -= PolyBlep(shifted, increment_);
            break;
        }
        case Waveform::Sawtooth:
            value = 2.0 * phase_ - 1.0;
            value -= PolyBlep(phase_, increment_);
            break;
        case Waveform::Triangle:
            // Starts at 0 rising, like the sine.
            if (phase_ < 0.25) {
                value = 4.0 * phase_;
            } else if (phase_ < 0.75) {
                value = 2.0 - 4.0 * phase_;
            } else {
                value = 4.0 * phase_ - 4.0;
            }
            break;
    }

    phase_ += increment_;
    if (phase_ >= 1.0) {
        phase_ -= 1.0;
    }
    return static_cast<float>(value);
}

}  // namespace dsp
