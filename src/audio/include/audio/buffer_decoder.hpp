#pragma once

#include "audio/audio_types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace nle::audio {

struct DecodeResult {
    AudioError error = AudioError::None;
    std::shared_ptr<const AudioBuffer> buffer;
    std::string message;

    bool ok() const { return error == AudioError::None && buffer && !buffer->empty(); }
};

/**
 * @brief Turns an asset URL into decoded PCM
 *
 * Called from worker threads; implementations must be safe to call concurrently.
 */
class BufferDecoder {
public:
    virtual ~BufferDecoder() = default;
    virtual DecodeResult decode(const std::string& url) = 0;
};

/**
 * @brief Decoder serving pre-registered buffers (tests, synthetic previews)
 */
class MemoryBufferDecoder : public BufferDecoder {
public:
    using Generator = std::function<DecodeResult(const std::string& url)>;

    void add(const std::string& url, AudioBuffer buffer);
    void add_failure(const std::string& url, AudioError error, std::string message = {});
    // Consulted for URLs that were not registered
    void set_fallback(Generator generator);

    DecodeResult decode(const std::string& url) override;

    size_t decode_count(const std::string& url) const;
    size_t total_decodes() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, DecodeResult> entries_;
    std::map<std::string, size_t> counts_;
    Generator fallback_;
    size_t total_ = 0;
};

} // namespace nle::audio
