#pragma once

#include <cstddef>
#include <vector>

#include "dsp/ImpulseResponse.h"
#include "dsp/PartitionedConvolver.h"

namespace dsp {

// Mono-in / stereo-wet convolution reverb on top of PartitionedConvolver.
// The wet output lags the input by one block; the wet gain is smoothed.
class ConvolutionReverb {
public:
    static constexpr std::size_t kDefaultBlockSize = 1024;

    void configure(double sampleRate, std::size_t blockSize = kDefaultBlockSize);
    void setImpulseResponse(const ImpulseResponse& ir);
    bool hasImpulseResponse() const { return !kernelLeft_.empty(); }

    void setWetGain(float gain);
    float wetGain() const { return targetGain_; }

    void reset();

    // Adds the wet signal for `frames` input samples into outL/outR.
    void process(const float* input, float* outL, float* outR, std::size_t frames);

    // True while no input has arrived for longer than the IR and the tail is silent.
    bool idle() const { return silentBlocks_ > partitionCount_ + 1; }

private:
    void rebuild();
    void processBlock();

    double sampleRate_ = 44100.0;
    std::size_t blockSize_ = kDefaultBlockSize;
    std::size_t partitionCount_ = 0;

    float targetGain_ = 0.0f;
    float currentGain_ = 0.0f;
    float gainSmoothingAlpha_ = 1.0f;

    ConvolutionKernel kernelLeft_;
    ConvolutionKernel kernelRight_;
    PartitionedConvolver convolver_;
    std::vector<float> overlapL_;
    std::vector<float> overlapR_;

    std::vector<float> inBlock_;
    std::vector<float> wetL_;
    std::vector<float> wetR_;
    std::size_t pos_ = 0;
    std::size_t silentBlocks_ = 0;
};

}  // namespace dsp
