#include "dsp/ParamTimeline.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
double Interpolate(ParamTimeline::EventType type,
                   double t0,
                   double v0,
                   double t1,
                   double v1,
                   double t) {
    if (t1 <= t0) {
        return v1;
    }
    const double x = std::clamp((t - t0) / (t1 - t0), 0.0, 1.0);
    if (type == ParamTimeline::EventType::ExponentialRamp) {
        // Undefined across zero or a sign change; hold then jump.
        if (v0 == 0.0 || v1 == 0.0 || (v0 < 0.0) != (v1 < 0.0)) {
            return x < 1.0 ? v0 : v1;
        }
        return v0 * std::pow(v1 / v0, x);
    }
    return v0 + (v1 - v0) * x;
}
}  // namespace

ParamTimeline::ParamTimeline(double initialValue) : initialValue_(initialValue) {}

void ParamTimeline::insert(const Event& event) {
    if (!std::isfinite(event.time) || !std::isfinite(event.value)) {
        return;
    }
    const auto it = std::upper_bound(
        events_.begin(), events_.end(), event.time,
        [](double time, const Event& e) { return time < e.time; });
    events_.insert(it, event);
}

void ParamTimeline::setValueAtTime(double value, double time) {
    insert({EventType::SetValue, time, value});
}

void ParamTimeline::linearRampToValueAtTime(double value, double time) {
    insert({EventType::LinearRamp, time, value});
}

void ParamTimeline::exponentialRampToValueAtTime(double value, double time) {
    insert({EventType::ExponentialRamp, time, value});
}

void ParamTimeline::cancelScheduledValues(double time) {
    const auto it = std::lower_bound(
        events_.begin(), events_.end(), time,
        [](const Event& e, double t) { return e.time < t; });
    events_.erase(it, events_.end());
}

void ParamTimeline::cancelAndHoldAtTime(double time) {
    const double held = valueAt(time);
    cancelScheduledValues(time);
    setValueAtTime(held, time);
}

double ParamTimeline::valueAt(double time) const {
    double prevTime = 0.0;
    double prevValue = initialValue_;
    for (const auto& e : events_) {
        if (e.time <= time) {
            prevTime = e.time;
            prevValue = e.value;
            continue;
        }
        if (e.type == EventType::SetValue) {
            return prevValue;
        }
        return Interpolate(e.type, prevTime, prevValue, e.time, e.value, time);
    }
    return prevValue;
}

void ParamTimeline::fill(double startTime, double step, float* out, std::size_t count) const {
    if (!out) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = static_cast<float>(valueAt(startTime + static_cast<double>(i) * step));
    }
}

double ParamTimeline::endTime() const {
    return events_.empty() ? 0.0 : events_.back().time;
}

}  // namespace dsp
