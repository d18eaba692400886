#include "dsp/PartitionedConvolver.h"

#include <algorithm>
#include <cmath>

namespace dsp {

void PartitionedConvolver::configure(std::size_t blockSize,
                                     std::size_t fftSize,
                                     std::size_t maxPartitions) {
    blockSize_ = blockSize;
    fftSize_ = std::max(fftSize, blockSize * 2);
    ringSize_ = std::max<std::size_t>(1, maxPartitions);
    ringIndex_ = 0;

    fft_.resize(fftSize_);

    xRing_.assign(ringSize_, std::vector<std::complex<float>>(fftSize_));
    work_.assign(fftSize_, {});
    accFreq_.assign(fftSize_, {});
}

void PartitionedConvolver::reset() {
    for (auto& frame : xRing_) {
        std::fill(frame.begin(), frame.end(), std::complex<float>(0.0f, 0.0f));
    }
    ringIndex_ = 0;
}

void PartitionedConvolver::pushInputBlock(const float* input) {
    if (!input || blockSize_ == 0 || xRing_.empty()) {
        return;
    }

    auto& dst = xRing_[ringIndex_];
    for (std::size_t i = 0; i < blockSize_; ++i) {
        dst[i] = std::complex<float>(input[i], 0.0f);
    }
    std::fill(dst.begin() + static_cast<std::ptrdiff_t>(blockSize_), dst.end(),
              std::complex<float>(0.0f, 0.0f));
    fft_.forward(dst);
    ringIndex_ = (ringIndex_ + 1) % ringSize_;
}

void PartitionedConvolver::convolve(const ConvolutionKernel& kernel,
                                    float* out,
                                    std::vector<float>& overlap) {
    if (!out || blockSize_ == 0 || xRing_.empty()) {
        return;
    }
    if (overlap.size() != blockSize_) {
        overlap.assign(blockSize_, 0.0f);
    }
    if (kernel.empty() || kernel.fftSize != fftSize_) {
        // Flush whatever tail is left from a previous kernel.
        std::copy(overlap.begin(), overlap.end(), out);
        std::fill(overlap.begin(), overlap.end(), 0.0f);
        return;
    }

    const std::size_t partCount = std::min(kernel.partitions.size(), ringSize_);
    std::fill(accFreq_.begin(), accFreq_.end(), std::complex<float>(0.0f, 0.0f));

    // ringIndex_ points to the next write; most recent block is ringIndex_-1.
    for (std::size_t p = 0; p < partCount; ++p) {
        const std::size_t idx = (ringIndex_ + ringSize_ - 1 - p) % ringSize_;
        const auto& X = xRing_[idx];
        const auto& H = kernel.partitions[p];
        for (std::size_t k = 0; k < fftSize_; ++k) {
            accFreq_[k] += X[k] * H[k];
        }
    }

    work_ = accFreq_;
    fft_.inverse(work_);

    for (std::size_t i = 0; i < blockSize_; ++i) {
        out[i] = work_[i].real() + overlap[i];
        overlap[i] = work_[i + blockSize_].real();
    }
}

ConvolutionKernel PartitionedConvolver::buildKernelFromIr(const std::vector<float>& ir,
                                                          std::size_t blockSize,
                                                          std::size_t fftSize) {
    ConvolutionKernel kernel;
    if (ir.empty() || blockSize == 0 || fftSize < blockSize * 2) {
        return kernel;
    }
    kernel.blockSize = blockSize;
    kernel.fftSize = fftSize;
    const std::size_t partCount = (ir.size() + blockSize - 1) / blockSize;
    kernel.partitions.assign(partCount, std::vector<std::complex<float>>(fftSize));

    Fft fft(fftSize);
    for (std::size_t p = 0; p < partCount; ++p) {
        const std::size_t offset = p * blockSize;
        const std::size_t copyCount = std::min(blockSize, ir.size() - offset);

        auto& freq = kernel.partitions[p];
        for (std::size_t i = 0; i < copyCount; ++i) {
            freq[i] = std::complex<float>(ir[offset + i], 0.0f);
        }
        fft.forward(freq);
    }
    return kernel;
}

}  // namespace dsp
