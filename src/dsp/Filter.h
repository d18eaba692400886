#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace dsp {

enum class FilterType { Lowpass, Highpass, Bandpass };

std::optional<FilterType> FilterTypeFromName(std::string_view name);
const char* ToString(FilterType type);

class Filter {
public:
    virtual ~Filter() = default;
    virtual float process(float input) = 0;
    virtual void reset() {}
};

class OnePoleLowPass : public Filter {
public:
    explicit OnePoleLowPass(float alpha = 0.5f);

    void setAlpha(float alpha);
    float process(float input) override;
    void reset() override;

private:
    float alpha_;
    float state_;
};

// RBJ cookbook biquad, transposed direct form II.
class BiquadFilter : public Filter {
public:
    BiquadFilter() = default;
    BiquadFilter(FilterType type, double sampleRate, double cutoffHz, double q);

    void configure(FilterType type, double sampleRate, double cutoffHz, double q);
    float process(float input) override;
    void reset() override;

    FilterType type() const { return type_; }
    double cutoffHz() const { return cutoffHz_; }

private:
    FilterType type_ = FilterType::Lowpass;
    double cutoffHz_ = 1000.0;
    float b0_ = 1.0f;
    float b1_ = 0.0f;
    float b2_ = 0.0f;
    float a1_ = 0.0f;
    float a2_ = 0.0f;
    float z1_ = 0.0f;
    float z2_ = 0.0f;
};

// Static tanh soft clipper, normalized so that |x| = 1 maps to 1.
class Waveshaper : public Filter {
public:
    explicit Waveshaper(float drive = 3.0f);

    float process(float input) override;

private:
    float drive_;
    float norm_;
};

class FilterChain {
public:
    void addFilter(std::unique_ptr<Filter> filter);
    void clear();
    void reset();
    bool empty() const;
    std::size_t size() const { return filters_.size(); }
    float process(float input);

private:
    std::vector<std::unique_ptr<Filter>> filters_;
};

}  // namespace dsp
