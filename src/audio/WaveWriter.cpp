#include "audio/WaveWriter.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>

namespace audio {

namespace {

void WriteTag(std::ostream& stream, const char (&tag)[5]) {
    stream.write(tag, 4);
}

template <typename T>
void WriteLittleEndian(std::ostream& stream, T value) {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const char byte = static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF);
        stream.put(byte);
    }
}

}  // namespace

WaveWriter::WaveWriter(const WaveFormat& format) : format_(format) {}

bool WaveWriter::write(const std::filesystem::path& path,
                       const std::vector<float>& interleaved,
                       std::string& errorMessage) const {
    errorMessage.clear();
    const WaveFormat& format = format_;

    if (format.bitsPerSample != 16) {
        errorMessage = "仅支持 16 位 PCM";
        return false;
    }
    if (format.channels == 0 || format.sampleRate == 0) {
        errorMessage = "无效的 WAV 格式";
        return false;
    }
    if (interleaved.size() % format.channels != 0) {
        errorMessage = "样本数与声道数不匹配";
        return false;
    }

    const auto pcm = QuantizePcm16(interleaved);
    const uint32_t dataSize = static_cast<uint32_t>(pcm.size() * sizeof(int16_t));

    std::ofstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        errorMessage = "无法打开输出文件: " + path.string();
        return false;
    }

    WriteTag(stream, "RIFF");
    WriteLittleEndian<uint32_t>(stream, 36 + dataSize);
    WriteTag(stream, "WAVE");
    WriteTag(stream, "fmt ");
    WriteLittleEndian<uint32_t>(stream, 16);
    WriteLittleEndian<uint16_t>(stream, 1);  // PCM
    WriteLittleEndian<uint16_t>(stream, format.channels);
    WriteLittleEndian<uint32_t>(stream, format.sampleRate);
    WriteLittleEndian<uint32_t>(stream, format.byteRate());
    WriteLittleEndian<uint16_t>(stream, format.blockAlign());
    WriteLittleEndian<uint16_t>(stream, format.bitsPerSample);
    WriteTag(stream, "data");
    WriteLittleEndian<uint32_t>(stream, dataSize);
    for (int16_t value : pcm) {
        WriteLittleEndian<uint16_t>(stream, static_cast<uint16_t>(value));
    }

    if (!stream.good()) {
        errorMessage = "写入 WAV 文件失败: " + path.string();
        return false;
    }

    return true;
}

std::vector<int16_t> QuantizePcm16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm(samples.size());
    constexpr float kMax = static_cast<float>(std::numeric_limits<int16_t>::max());

    std::transform(samples.begin(), samples.end(), pcm.begin(), [](float sample) {
        if (!std::isfinite(sample)) {
            return int16_t{0};
        }
        sample = std::clamp(sample, -1.0f, 1.0f);
        return static_cast<int16_t>(std::lround(sample * kMax));
    });
    return pcm;
}

}  // namespace audio
