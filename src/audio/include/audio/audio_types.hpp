/**
 * @file audio_types.hpp
 * @brief Common audio type definitions
 *
 * Shared by the decoders, the buffer cache, the audio contexts and the scheduler.
 */

#pragma once

#include "core/time.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace nle::audio {

using NodeId = uint64_t;

/**
 * @brief Error codes reported by audio back-ends and decoders
 */
enum class AudioError {
    None,                   ///< No error
    InvalidFormat,          ///< Unsupported or invalid audio data
    DecodeFailed,           ///< Decoder produced no samples
    NotFound,               ///< Source URL could not be opened
    NetworkError,           ///< Remote fetch failed
    Unsupported,            ///< Back-end or build lacks the needed support
    InvalidArgument,        ///< Bad request parameters (negative duration, empty buffer)
    ContextClosed,          ///< Context already released
    UnknownNode,            ///< Node id not owned by the context
    Unknown                 ///< Unknown error
};

const char* to_string(AudioError error) noexcept;

/**
 * @brief Decoded PCM, interleaved 32-bit float
 */
struct AudioBuffer {
    uint32_t sample_rate = 48000;
    uint16_t channels = 2;
    std::vector<float> samples;

    size_t frame_count() const { return channels ? samples.size() / channels : 0; }
    Seconds duration() const { return sample_rate ? static_cast<Seconds>(frame_count()) / sample_rate : 0.0; }
    bool empty() const { return samples.empty(); }

    // Sample at a frame for a channel; mono buffers feed every channel
    float sample(size_t frame, uint16_t channel) const {
        if(channels == 0 || frame >= frame_count()) return 0.0f;
        uint16_t ch = channel < channels ? channel : static_cast<uint16_t>(channels - 1);
        return samples[frame * channels + ch];
    }

    static AudioBuffer silence(Seconds duration, uint32_t sample_rate = 48000, uint16_t channels = 2);
    static AudioBuffer sine(Seconds duration, double frequency, float amplitude = 0.5f,
                            uint32_t sample_rate = 48000, uint16_t channels = 2);
    static AudioBuffer constant(Seconds duration, float value, uint32_t sample_rate = 48000, uint16_t channels = 2);
};

} // namespace nle::audio
