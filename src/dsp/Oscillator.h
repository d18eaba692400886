#pragma once

#include <optional>
#include <string_view>

namespace dsp {

enum class Waveform { Sine, Square, Sawtooth, Triangle };

std::optional<Waveform> WaveformFromName(std::string_view name);
const char* ToString(Waveform waveform);

// Phase-accumulator oscillator. Square and sawtooth are band-limited with polyBLEP.
class Oscillator {
public:
    Oscillator() = default;
    Oscillator(Waveform waveform, double frequencyHz, double sampleRate);

    void configure(Waveform waveform, double frequencyHz, double sampleRate);
    void setFrequency(double frequencyHz);
    double frequency() const { return frequency_; }
    Waveform waveform() const { return waveform_; }

    void reset(double phase = 0.0);
    float next();

private:
    Waveform waveform_ = Waveform::Sine;
    double sampleRate_ = 44100.0;
    double frequency_ = 440.0;
    double phase_ = 0.0;      // 0..1
    double increment_ = 0.0;  // cycles per sample
};

}  // namespace dsp
