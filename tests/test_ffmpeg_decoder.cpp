#include <catch2/catch_test_macros.hpp>
#include "audio/ffmpeg_buffer_decoder.hpp"
#include "test_support.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace nle::audio;
using nle::test::approx;

namespace {

void put_u32(std::ofstream& ofs, uint32_t v) { for(int i = 0; i < 4; ++i) ofs.put(static_cast<char>((v >> (8 * i)) & 0xFF)); }
void put_u16(std::ofstream& ofs, uint16_t v) { for(int i = 0; i < 2; ++i) ofs.put(static_cast<char>((v >> (8 * i)) & 0xFF)); }

// 16-bit PCM WAV holding a constant sample value on every channel
std::string write_wav(const std::string& name, uint32_t rate, uint16_t channels, uint32_t frames, int16_t value) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream ofs(path, std::ios::binary);
    const uint32_t data_bytes = frames * channels * 2u;
    ofs.write("RIFF", 4); put_u32(ofs, 36 + data_bytes); ofs.write("WAVE", 4);
    ofs.write("fmt ", 4); put_u32(ofs, 16); put_u16(ofs, 1); put_u16(ofs, channels);
    put_u32(ofs, rate); put_u32(ofs, rate * channels * 2u); put_u16(ofs, static_cast<uint16_t>(channels * 2)); put_u16(ofs, 16);
    ofs.write("data", 4); put_u32(ofs, data_bytes);
    for(uint32_t i = 0; i < frames * channels; ++i) put_u16(ofs, static_cast<uint16_t>(value));
    return path;
}

} // namespace

#ifdef NLE_ENABLE_FFMPEG

TEST_CASE("ffmpeg decoder returns every frame of a file", "[audio][ffmpeg]") {
    auto path = write_wav("nle_decoder_full.wav", 48000, 2, 48000, 8192);
    FFmpegBufferDecoder decoder(48000, 2);
    auto result = decoder.decode(path);
    REQUIRE(result.error == AudioError::None);
    REQUIRE(result.buffer);
    REQUIRE(result.buffer->frame_count() == 48000);
    REQUIRE(approx(result.buffer->duration(), 1.0));
    REQUIRE(approx(result.buffer->samples[1000], 0.25, 1e-4));
    REQUIRE(approx(result.buffer->samples.back(), 0.25, 1e-4));
}

TEST_CASE("ffmpeg decoder upmixes mono files", "[audio][ffmpeg]") {
    auto path = write_wav("nle_decoder_mono.wav", 48000, 1, 24000, -16384);
    FFmpegBufferDecoder decoder(48000, 2);
    auto result = decoder.decode(path);
    REQUIRE(result.error == AudioError::None);
    REQUIRE(result.buffer->channels == 2);
    REQUIRE(approx(result.buffer->duration(), 0.5));
}

TEST_CASE("ffmpeg decoder reports missing files", "[audio][ffmpeg]") {
    FFmpegBufferDecoder decoder;
    auto result = decoder.decode((std::filesystem::temp_directory_path() / "nle_no_such_file.wav").string());
    REQUIRE(result.error == AudioError::NotFound);
    REQUIRE_FALSE(result.buffer);
}

#else

TEST_CASE("decoder built without ffmpeg reports unsupported", "[audio][ffmpeg]") {
    auto path = write_wav("nle_decoder_stub.wav", 48000, 2, 480, 0);
    FFmpegBufferDecoder decoder;
    auto result = decoder.decode(path);
    REQUIRE(result.error == AudioError::Unsupported);
    REQUIRE_FALSE(result.buffer);
}

#endif
