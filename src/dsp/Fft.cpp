#include "dsp/Fft.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
constexpr double kPi = 3.14159265358979323846;
}  // namespace

Fft::Fft(std::size_t size) { resize(size); }

bool Fft::isPowerOfTwo(std::size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

void Fft::resize(std::size_t size) {
    if (size == size_) {
        return;
    }
    size_ = size;
    buildTables();
}

void Fft::buildTables() {
    bitReverse_.clear();
    twiddles_.clear();
    if (size_ == 0 || !isPowerOfTwo(size_)) {
        // Leave empty; transform() will no-op.
        return;
    }
    bitReverse_.resize(size_);
    std::size_t bits = 0;
    while ((static_cast<std::size_t>(1) << bits) < size_) {
        ++bits;
    }
    for (std::size_t i = 0; i < size_; ++i) {
        std::size_t x = i;
        std::size_t r = 0;
        for (std::size_t b = 0; b < bits; ++b) {
            r = (r << 1) | (x & 1);
            x >>= 1;
        }
        bitReverse_[i] = r;
    }

    // Twiddles in double precision so long transforms don't accumulate the
    // rounding error of the incremental w *= wLen recurrence.
    twiddles_.resize(size_ / 2);
    for (std::size_t k = 0; k < twiddles_.size(); ++k) {
        const double angle = -2.0 * kPi * static_cast<double>(k) / static_cast<double>(size_);
        twiddles_[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
    }
}

void Fft::forward(std::vector<std::complex<float>>& data) const {
    transform(data, /*inverse=*/false);
}

void Fft::inverse(std::vector<std::complex<float>>& data) const {
    transform(data, /*inverse=*/true);
    if (size_ == 0) {
        return;
    }
    const float invN = 1.0f / static_cast<float>(size_);
    for (auto& v : data) {
        v *= invN;
    }
}

void Fft::transform(std::vector<std::complex<float>>& data, bool inverse) const {
    if (size_ == 0 || data.size() != size_ || bitReverse_.empty()) {
        return;
    }

    for (std::size_t i = 0; i < size_; ++i) {
        const std::size_t j = bitReverse_[i];
        if (j > i) {
            std::swap(data[i], data[j]);
        }
    }

    for (std::size_t len = 2; len <= size_; len <<= 1) {
        const std::size_t half = len >> 1;
        const std::size_t stride = size_ / len;
        for (std::size_t i = 0; i < size_; i += len) {
            for (std::size_t j = 0; j < half; ++j) {
                std::complex<float> w = twiddles_[j * stride];
                if (inverse) {
                    w = std::conj(w);
                }
                const auto u = data[i + j];
                const auto v = data[i + j + half] * w;
                data[i + j] = u + v;
                data[i + j + half] = u - v;
            }
        }
    }
}

}  // namespace dsp
