#include "audio/buffer_decoder.hpp"

namespace nle::audio {

void MemoryBufferDecoder::add(const std::string& url, AudioBuffer buffer) {
    std::scoped_lock lk(mutex_);
    DecodeResult r;
    r.buffer = std::make_shared<const AudioBuffer>(std::move(buffer));
    entries_[url] = std::move(r);
}

void MemoryBufferDecoder::add_failure(const std::string& url, AudioError error, std::string message) {
    std::scoped_lock lk(mutex_);
    DecodeResult r;
    r.error = error == AudioError::None ? AudioError::DecodeFailed : error;
    r.message = message.empty() ? std::string(to_string(r.error)) : std::move(message);
    entries_[url] = std::move(r);
}

void MemoryBufferDecoder::set_fallback(Generator generator) {
    std::scoped_lock lk(mutex_);
    fallback_ = std::move(generator);
}

DecodeResult MemoryBufferDecoder::decode(const std::string& url) {
    Generator fallback;
    {
        std::scoped_lock lk(mutex_);
        ++counts_[url];
        ++total_;
        auto it = entries_.find(url);
        if(it != entries_.end()) return it->second;
        fallback = fallback_;
    }
    if(fallback) return fallback(url);
    return DecodeResult{AudioError::NotFound, nullptr, "no buffer registered for " + url};
}

size_t MemoryBufferDecoder::decode_count(const std::string& url) const {
    std::scoped_lock lk(mutex_);
    auto it = counts_.find(url);
    return it == counts_.end() ? 0 : it->second;
}

size_t MemoryBufferDecoder::total_decodes() const {
    std::scoped_lock lk(mutex_);
    return total_;
}

} // namespace nle::audio
