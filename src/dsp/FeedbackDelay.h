#pragma once

#include <cstddef>
#include <vector>

namespace dsp {

// Single-tap delay line whose output is fed back into its input.
// process() adds the wet tap, scaled by the wet gain, to both outputs.
class FeedbackDelay {
public:
    static constexpr double kMaxDelaySeconds = 2.0;

    void configure(double sampleRate, double maxDelaySeconds = kMaxDelaySeconds);

    void setDelaySeconds(double seconds);
    double delaySeconds() const { return delaySeconds_; }

    void setFeedback(float feedback);  // clamped to [0, 0.99]
    float feedback() const { return feedback_; }

    void setWetGain(float gain);
    float wetGain() const { return targetGain_; }

    void reset();
    void process(const float* input, float* outL, float* outR, std::size_t frames);

private:
    double sampleRate_ = 44100.0;
    double maxDelaySeconds_ = kMaxDelaySeconds;
    double delaySeconds_ = 0.3;
    std::size_t delaySamples_ = 1;

    float feedback_ = 0.4f;
    float targetGain_ = 0.0f;
    float currentGain_ = 0.0f;
    float gainSmoothingAlpha_ = 1.0f;

    std::vector<float> buffer_;
    std::size_t writeIndex_ = 0;
};

}  // namespace dsp
