#pragma once

#include "audio/buffer_decoder.hpp"

namespace nle::audio {

/**
 * @brief Whole-file decoder backed by libavformat/libavcodec/libswresample
 *
 * Opens the URL (local path or any protocol FFmpeg was built with), decodes the
 * best audio stream and converts it to interleaved float at the target rate and
 * channel count. Builds without NLE_ENABLE_FFMPEG report AudioError::Unsupported.
 */
class FFmpegBufferDecoder : public BufferDecoder {
public:
    explicit FFmpegBufferDecoder(uint32_t target_sample_rate = 48000, uint16_t target_channels = 2);

    DecodeResult decode(const std::string& url) override;

    uint32_t target_sample_rate() const { return target_sample_rate_; }
    uint16_t target_channels() const { return target_channels_; }

private:
    uint32_t target_sample_rate_;
    uint16_t target_channels_;
};

} // namespace nle::audio
