#include "audio/audio_types.hpp"
#include <cmath>

namespace nle::audio {

const char* to_string(AudioError error) noexcept {
    switch(error) {
        case AudioError::None: return "none";
        case AudioError::InvalidFormat: return "invalid format";
        case AudioError::DecodeFailed: return "decode failed";
        case AudioError::NotFound: return "not found";
        case AudioError::NetworkError: return "network error";
        case AudioError::Unsupported: return "unsupported";
        case AudioError::InvalidArgument: return "invalid argument";
        case AudioError::ContextClosed: return "context closed";
        case AudioError::UnknownNode: return "unknown node";
        case AudioError::Unknown: return "unknown";
    }
    return "unknown";
}

AudioBuffer AudioBuffer::silence(Seconds duration, uint32_t sample_rate, uint16_t channels) {
    return constant(duration, 0.0f, sample_rate, channels);
}

AudioBuffer AudioBuffer::constant(Seconds duration, float value, uint32_t sample_rate, uint16_t channels) {
    AudioBuffer buf;
    buf.sample_rate = sample_rate;
    buf.channels = channels;
    size_t frames = duration > 0.0 ? static_cast<size_t>(std::llround(duration * sample_rate)) : 0;
    buf.samples.assign(frames * channels, value);
    return buf;
}

AudioBuffer AudioBuffer::sine(Seconds duration, double frequency, float amplitude,
                              uint32_t sample_rate, uint16_t channels) {
    AudioBuffer buf = silence(duration, sample_rate, channels);
    constexpr double two_pi = 6.283185307179586;
    const size_t frames = buf.frame_count();
    for(size_t i = 0; i < frames; ++i) {
        float v = amplitude * static_cast<float>(std::sin(two_pi * frequency * static_cast<double>(i) / sample_rate));
        for(uint16_t c = 0; c < channels; ++c) buf.samples[i * channels + c] = v;
    }
    return buf;
}

} // namespace nle::audio
