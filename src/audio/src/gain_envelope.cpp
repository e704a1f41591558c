#include "audio/gain_envelope.hpp"
#include <algorithm>

namespace nle::audio {

void GainEnvelope::set_value_at(float value, Seconds time) {
    if(!events_.empty()) time = std::max(time, events_.back().time);
    events_.push_back(Event{EventType::SetValue, time, value});
}

void GainEnvelope::linear_ramp_to(float value, Seconds end_time) {
    if(!events_.empty()) end_time = std::max(end_time, events_.back().time);
    events_.push_back(Event{EventType::LinearRamp, end_time, value});
}

float GainEnvelope::value_at(Seconds time) const {
    float prev_value = default_value_;
    Seconds prev_time = events_.empty() ? 0.0 : std::min(0.0, events_.front().time);
    for(const auto& e : events_) {
        if(time < e.time) {
            if(e.type == EventType::LinearRamp && e.time > prev_time) {
                double f = (time - prev_time) / (e.time - prev_time);
                if(f < 0.0) return prev_value;
                return prev_value + static_cast<float>(f) * (e.value - prev_value);
            }
            return prev_value;
        }
        prev_value = e.value;
        prev_time = e.time;
    }
    return prev_value;
}

} // namespace nle::audio
