#pragma once

#include <cstdint>

#if defined(__SSE__) || defined(_M_IX86) || defined(_M_X64)
#include <xmmintrin.h>
#define NOTELAB_DENORMALS_SSE 1
#elif defined(__aarch64__)
#define NOTELAB_DENORMALS_FPCR 1
#endif

namespace dsp {

// Flushes subnormals to zero for the current thread while in scope.
// Reverb and delay tails decay into the denormal range and would otherwise
// stall the render callback.
class ScopedDenormalsDisable {
public:
    ScopedDenormalsDisable() {
#if defined(NOTELAB_DENORMALS_SSE)
        oldState_ = static_cast<std::uint64_t>(_mm_getcsr());
        // MXCSR: DAZ = bit 6, FTZ = bit 15.
        _mm_setcsr(static_cast<unsigned int>(oldState_ | 0x0040u | 0x8000u));
        active_ = true;
#elif defined(NOTELAB_DENORMALS_FPCR)
        std::uint64_t fpcr = 0;
        asm volatile("mrs %0, fpcr" : "=r"(fpcr));
        oldState_ = fpcr;
        // FPCR: FZ = bit 24.
        fpcr |= (1ull << 24);
        asm volatile("msr fpcr, %0" : : "r"(fpcr));
        active_ = true;
#endif
    }

    ScopedDenormalsDisable(const ScopedDenormalsDisable&) = delete;
    ScopedDenormalsDisable& operator=(const ScopedDenormalsDisable&) = delete;

    ~ScopedDenormalsDisable() {
        if (!active_) {
            return;
        }
#if defined(NOTELAB_DENORMALS_SSE)
        _mm_setcsr(static_cast<unsigned int>(oldState_));
#elif defined(NOTELAB_DENORMALS_FPCR)
        asm volatile("msr fpcr, %0" : : "r"(oldState_));
#endif
    }

private:
    std::uint64_t oldState_ = 0;
    bool active_ = false;
};

}  // namespace dsp
