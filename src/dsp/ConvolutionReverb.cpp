#include "dsp/ConvolutionReverb.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
constexpr float kSilenceThreshold = 1.0e-9f;

float Clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }

float ComputeOnePoleAlpha(double sampleRate, double timeSeconds) {
    if (sampleRate <= 0.0 || timeSeconds <= 0.0) {
        return 1.0f;
    }
    const double a = 1.0 - std::exp(-1.0 / (sampleRate * timeSeconds));
    return static_cast<float>(std::clamp(a, 0.0, 1.0));
}

bool IsSilent(const std::vector<float>& block) {
    for (float s : block) {
        if (std::fabs(s) > kSilenceThreshold) {
            return false;
        }
    }
    return true;
}
}  // namespace

void ConvolutionReverb::configure(double sampleRate, std::size_t blockSize) {
    if (sampleRate <= 0.0 || blockSize == 0) {
        return;
    }
    sampleRate_ = sampleRate;
    blockSize_ = blockSize;
    gainSmoothingAlpha_ = ComputeOnePoleAlpha(sampleRate_, 0.01);
    kernelLeft_ = {};
    kernelRight_ = {};
    partitionCount_ = 0;
    rebuild();
}

void ConvolutionReverb::setImpulseResponse(const ImpulseResponse& ir) {
    const std::size_t fftSize = blockSize_ * 2;
    kernelLeft_ = PartitionedConvolver::buildKernelFromIr(ir.left, blockSize_, fftSize);
    kernelRight_ = ir.right.empty()
                       ? kernelLeft_
                       : PartitionedConvolver::buildKernelFromIr(ir.right, blockSize_, fftSize);
    partitionCount_ = std::max(kernelLeft_.partitions.size(), kernelRight_.partitions.size());
    rebuild();
}

void ConvolutionReverb::setWetGain(float gain) { targetGain_ = Clamp01(gain); }

void ConvolutionReverb::reset() {
    convolver_.reset();
    std::fill(overlapL_.begin(), overlapL_.end(), 0.0f);
    std::fill(overlapR_.begin(), overlapR_.end(), 0.0f);
    std::fill(inBlock_.begin(), inBlock_.end(), 0.0f);
    std::fill(wetL_.begin(), wetL_.end(), 0.0f);
    std::fill(wetR_.begin(), wetR_.end(), 0.0f);
    pos_ = 0;
    silentBlocks_ = partitionCount_ + 2;
    currentGain_ = targetGain_;
}

void ConvolutionReverb::rebuild() {
    convolver_.configure(blockSize_, blockSize_ * 2, std::max<std::size_t>(1, partitionCount_));
    overlapL_.assign(blockSize_, 0.0f);
    overlapR_.assign(blockSize_, 0.0f);
    inBlock_.assign(blockSize_, 0.0f);
    wetL_.assign(blockSize_, 0.0f);
    wetR_.assign(blockSize_, 0.0f);
    reset();
}

void ConvolutionReverb::process(const float* input,
                                float* outL,
                                float* outR,
                                std::size_t frames) {
    if (!input || !outL || !outR || inBlock_.size() != blockSize_) {
        return;
    }
    for (std::size_t i = 0; i < frames; ++i) {
        currentGain_ += (targetGain_ - currentGain_) * gainSmoothingAlpha_;
        outL[i] += wetL_[pos_] * currentGain_;
        outR[i] += wetR_[pos_] * currentGain_;

        inBlock_[pos_] = input[i];
        if (++pos_ >= blockSize_) {
            processBlock();
            pos_ = 0;
        }
    }
}

void ConvolutionReverb::processBlock() {
    if (!hasImpulseResponse()) {
        std::fill(wetL_.begin(), wetL_.end(), 0.0f);
        std::fill(wetR_.begin(), wetR_.end(), 0.0f);
        return;
    }

    if (IsSilent(inBlock_)) {
        ++silentBlocks_;
    } else {
        silentBlocks_ = 0;
    }
    // Once every partition has seen only silence, the ring and the overlap are
    // zero and the convolution can be skipped until input returns.
    if (idle()) {
        std::fill(wetL_.begin(), wetL_.end(), 0.0f);
        std::fill(wetR_.begin(), wetR_.end(), 0.0f);
        return;
    }

    convolver_.pushInputBlock(inBlock_.data());
    convolver_.convolve(kernelLeft_, wetL_.data(), overlapL_);
    convolver_.convolve(kernelRight_, wetR_.data(), overlapR_);
}

}  // namespace dsp
