#include "dsp/FeedbackDelay.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
constexpr float kMaxFeedback = 0.99f;

float ComputeOnePoleAlpha(double sampleRate, double timeSeconds) {
    if (sampleRate <= 0.0 || timeSeconds <= 0.0) {
        return 1.0f;
    }
    const double a = 1.0 - std::exp(-1.0 / (sampleRate * timeSeconds));
    return static_cast<float>(std::clamp(a, 0.0, 1.0));
}
}  // namespace

void FeedbackDelay::configure(double sampleRate, double maxDelaySeconds) {
    if (sampleRate <= 0.0 || maxDelaySeconds <= 0.0) {
        return;
    }
    sampleRate_ = sampleRate;
    maxDelaySeconds_ = maxDelaySeconds;
    gainSmoothingAlpha_ = ComputeOnePoleAlpha(sampleRate_, 0.01);
    const auto capacity = static_cast<std::size_t>(std::ceil(sampleRate_ * maxDelaySeconds_)) + 1;
    buffer_.assign(capacity, 0.0f);
    writeIndex_ = 0;
    setDelaySeconds(delaySeconds_);
}

void FeedbackDelay::setDelaySeconds(double seconds) {
    delaySeconds_ = std::clamp(seconds, 0.0, maxDelaySeconds_);
    if (buffer_.empty()) {
        return;
    }
    const auto samples = static_cast<std::size_t>(std::lround(delaySeconds_ * sampleRate_));
    delaySamples_ = std::clamp<std::size_t>(samples, 1, buffer_.size() - 1);
}

void FeedbackDelay::setFeedback(float feedback) {
    feedback_ = std::clamp(feedback, 0.0f, kMaxFeedback);
}

void FeedbackDelay::setWetGain(float gain) {
    targetGain_ = std::clamp(gain, 0.0f, 1.0f);
}

void FeedbackDelay::reset() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    writeIndex_ = 0;
    currentGain_ = targetGain_;
}

void FeedbackDelay::process(const float* input, float* outL, float* outR, std::size_t frames) {
    if (!input || !outL || !outR || buffer_.empty()) {
        return;
    }
    const std::size_t size = buffer_.size();
    for (std::size_t i = 0; i < frames; ++i) {
        const std::size_t readIndex = (writeIndex_ + size - delaySamples_) % size;
        const float delayed = buffer_[readIndex];
        buffer_[writeIndex_] = input[i] + delayed * feedback_;
        writeIndex_ = (writeIndex_ + 1) % size;

        currentGain_ += (targetGain_ - currentGain_) * gainSmoothingAlpha_;
        const float wet = delayed * currentGain_;
        outL[i] += wet;
        outR[i] += wet;
    }
}

}  // namespace dsp
