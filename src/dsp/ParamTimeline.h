#pragma once

#include <cstddef>
#include <vector>

namespace dsp {

// Automation curve on an absolute time axis (seconds).
// Events are kept sorted by time; a ramp event interpolates from the previous
// event's (time, value) to its own, a set event jumps at its time.
class ParamTimeline {
public:
    enum class EventType { SetValue, LinearRamp, ExponentialRamp };

    struct Event {
        EventType type = EventType::SetValue;
        double time = 0.0;
        double value = 0.0;
    };

    explicit ParamTimeline(double initialValue = 0.0);

    void setValueAtTime(double value, double time);
    void linearRampToValueAtTime(double value, double time);
    void exponentialRampToValueAtTime(double value, double time);

    // Removes every event at or after `time`.
    void cancelScheduledValues(double time);
    // Freezes the curve at its value at `time` and drops everything later.
    void cancelAndHoldAtTime(double time);

    double valueAt(double time) const;
    // out[i] = valueAt(startTime + i * step)
    void fill(double startTime, double step, float* out, std::size_t count) const;

    const std::vector<Event>& events() const { return events_; }
    double initialValue() const { return initialValue_; }
    // Time of the last event, or 0 when empty.
    double endTime() const;

private:
    void insert(const Event& event);

    double initialValue_;
    std::vector<Event> events_;
};

}  // namespace dsp
