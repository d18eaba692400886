#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dsp {

struct ImpulseResponse {
    double sampleRate = 0.0;
    std::vector<float> left;
    std::vector<float> right;

    bool empty() const { return left.empty(); }
    std::size_t length() const { return left.size(); }
};

// Stereo decaying noise: each channel is uniform noise shaped by (1 - i/N)^decay,
// softened by a one-pole low-pass and normalized to a calibrated RMS.
// seed == 0 uses std::random_device.
ImpulseResponse GenerateImpulseResponse(double sampleRate,
                                        double durationSeconds = 2.0,
                                        double decay = 2.5,
                                        std::uint32_t seed = 0);

// Scales the response so that its overall RMS lands at a fixed calibration
// level, independent of length and sample rate.
void NormalizeImpulseResponse(ImpulseResponse& ir);

}  // namespace dsp
