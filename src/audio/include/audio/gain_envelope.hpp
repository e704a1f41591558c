#pragma once

#include "core/time.hpp"
#include <vector>

namespace nle::audio {

/**
 * @brief Automation curve for a clip gain, in context time
 *
 * Follows the usual audio-param rules: set_value_at() jumps at its time,
 * linear_ramp_to() ramps from the previous event's value and time to its own.
 * Before the first event the default value applies. Events must be added in
 * non-decreasing time order; earlier times are clamped to the last event.
 */
class GainEnvelope {
public:
    enum class EventType { SetValue, LinearRamp };
    struct Event {
        EventType type = EventType::SetValue;
        Seconds time = 0.0;
        float value = 1.0f;
    };

    explicit GainEnvelope(float default_value = 1.0f) : default_value_(default_value) {}

    void set_value_at(float value, Seconds time);
    void linear_ramp_to(float value, Seconds end_time);

    float value_at(Seconds time) const;

    const std::vector<Event>& events() const { return events_; }
    bool empty() const { return events_.empty(); }
    void clear() { events_.clear(); }
    float default_value() const { return default_value_; }
    Seconds last_time() const { return events_.empty() ? 0.0 : events_.back().time; }

private:
    float default_value_;
    std::vector<Event> events_;
};

} // namespace nle::audio
