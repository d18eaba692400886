#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace audio {

// Only 16-bit PCM is written.
struct WaveFormat {
    uint32_t sampleRate = 44100;
    uint16_t channels = 2;
    uint16_t bitsPerSample = 16;

    uint16_t blockAlign() const { return static_cast<uint16_t>(channels * (bitsPerSample / 8)); }
    uint32_t byteRate() const { return sampleRate * blockAlign(); }
};

// Clamps to [-1, 1]; non-finite samples become silence.
std::vector<int16_t> QuantizePcm16(const std::vector<float>& samples);

// RIFF/WAVE writer for interleaved float buffers.
class WaveWriter {
public:
    explicit WaveWriter(const WaveFormat& format = {});

    const WaveFormat& format() const { return format_; }

    bool write(const std::filesystem::path& path,
               const std::vector<float>& interleaved,
               std::string& errorMessage) const;

private:
    WaveFormat format_;
};

}  // namespace audio
