#include "audio/ffmpeg_buffer_decoder.hpp"
#include "core/log.hpp"

#ifdef NLE_ENABLE_FFMPEG
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}
#endif

namespace nle::audio {

namespace {

#ifdef NLE_ENABLE_FFMPEG
std::string ffmpeg_error_string(int error_code) {
    char error_buf[AV_ERROR_MAX_STRING_SIZE];
    av_make_error_string(error_buf, AV_ERROR_MAX_STRING_SIZE, error_code);
    return std::string(error_buf);
}

// Owns every FFmpeg object of one decode call
struct DecodeSession {
    AVFormatContext* fmt = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    SwrContext* swr = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;

    ~DecodeSession() {
        if(frame) av_frame_free(&frame);
        if(packet) av_packet_free(&packet);
        if(swr) swr_free(&swr);
        if(codec_ctx) avcodec_free_context(&codec_ctx);
        if(fmt) avformat_close_input(&fmt);
    }
};

DecodeResult fail(AudioError err, const std::string& msg) {
    nle::log::error("FFmpegBufferDecoder: " + msg);
    return DecodeResult{err, nullptr, msg};
}

bool append_converted(DecodeSession& s, const AVFrame* in, uint16_t channels, std::vector<float>& out) {
    int max_out = swr_get_out_samples(s.swr, in ? in->nb_samples : 0);
    if(max_out <= 0) return true;
    size_t base = out.size();
    out.resize(base + static_cast<size_t>(max_out) * channels);
    uint8_t* out_ptr = reinterpret_cast<uint8_t*>(out.data() + base);
    int got = swr_convert(s.swr, &out_ptr, max_out,
                          in ? const_cast<const uint8_t**>(in->extended_data) : nullptr,
                          in ? in->nb_samples : 0);
    if(got < 0) {
        out.resize(base);
        return false;
    }
    out.resize(base + static_cast<size_t>(got) * channels);
    return true;
}
#endif

} // namespace

FFmpegBufferDecoder::FFmpegBufferDecoder(uint32_t target_sample_rate, uint16_t target_channels)
    : target_sample_rate_(target_sample_rate ? target_sample_rate : 48000)
    , target_channels_(target_channels ? target_channels : 2) {}

#ifdef NLE_ENABLE_FFMPEG

DecodeResult FFmpegBufferDecoder::decode(const std::string& url) {
    DecodeSession s;
    int ret = avformat_open_input(&s.fmt, url.c_str(), nullptr, nullptr);
    if(ret < 0) return fail(AudioError::NotFound, "cannot open " + url + ": " + ffmpeg_error_string(ret));
    ret = avformat_find_stream_info(s.fmt, nullptr);
    if(ret < 0) return fail(AudioError::InvalidFormat, "no stream info in " + url + ": " + ffmpeg_error_string(ret));

    const AVCodec* codec = nullptr;
    int stream_index = av_find_best_stream(s.fmt, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if(stream_index < 0 || !codec) return fail(AudioError::InvalidFormat, "no audio stream in " + url);

    s.codec_ctx = avcodec_alloc_context3(codec);
    if(!s.codec_ctx) return fail(AudioError::Unknown, "failed to allocate codec context");
    ret = avcodec_parameters_to_context(s.codec_ctx, s.fmt->streams[stream_index]->codecpar);
    if(ret < 0) return fail(AudioError::InvalidFormat, "bad codec parameters: " + ffmpeg_error_string(ret));
    ret = avcodec_open2(s.codec_ctx, codec, nullptr);
    if(ret < 0) return fail(AudioError::DecodeFailed, "failed to open codec: " + ffmpeg_error_string(ret));

    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, target_channels_);
    ret = swr_alloc_set_opts2(&s.swr, &out_layout, AV_SAMPLE_FMT_FLT, static_cast<int>(target_sample_rate_),
                              &s.codec_ctx->ch_layout, s.codec_ctx->sample_fmt, s.codec_ctx->sample_rate, 0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if(ret < 0 || swr_init(s.swr) < 0) return fail(AudioError::DecodeFailed, "failed to initialise resampler");

    s.packet = av_packet_alloc();
    s.frame = av_frame_alloc();
    if(!s.packet || !s.frame) return fail(AudioError::Unknown, "failed to allocate packet/frame");

    std::vector<float> samples;
    auto drain = [&]() -> bool {
        while(true) {
            int r = avcodec_receive_frame(s.codec_ctx, s.frame);
            if(r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
            if(r < 0) return false;
            bool ok = append_converted(s, s.frame, target_channels_, samples);
            av_frame_unref(s.frame);
            if(!ok) return false;
        }
    };

    while(av_read_frame(s.fmt, s.packet) >= 0) {
        if(s.packet->stream_index == stream_index) {
            ret = avcodec_send_packet(s.codec_ctx, s.packet);
            if(ret == AVERROR(EAGAIN)) {
                // output queue full: empty it, then the same packet is accepted
                if(!drain()) {
                    av_packet_unref(s.packet);
                    return fail(AudioError::DecodeFailed, "decode error in " + url);
                }
                ret = avcodec_send_packet(s.codec_ctx, s.packet);
            }
            if(ret < 0) {
                nle::log::warn("FFmpegBufferDecoder: skipping bad packet in " + url + ": " + ffmpeg_error_string(ret));
            } else if(!drain()) {
                av_packet_unref(s.packet);
                return fail(AudioError::DecodeFailed, "decode error in " + url);
            }
        }
        av_packet_unref(s.packet);
    }
    ret = avcodec_send_packet(s.codec_ctx, nullptr);
    if(ret < 0 && ret != AVERROR_EOF) {
        return fail(AudioError::DecodeFailed, "failed to flush decoder for " + url + ": " + ffmpeg_error_string(ret));
    }
    if(!drain()) return fail(AudioError::DecodeFailed, "decode error while flushing " + url);
    if(!append_converted(s, nullptr, target_channels_, samples)) {
        return fail(AudioError::DecodeFailed, "resampler flush failed for " + url);
    }
    if(samples.empty()) return fail(AudioError::DecodeFailed, "no audio samples decoded from " + url);

    auto buffer = std::make_shared<AudioBuffer>();
    buffer->sample_rate = target_sample_rate_;
    buffer->channels = target_channels_;
    buffer->samples = std::move(samples);
    nle::log::info("Decoded " + url + " (" + std::to_string(buffer->duration()) + "s)");
    return DecodeResult{AudioError::None, std::move(buffer), {}};
}

#else

DecodeResult FFmpegBufferDecoder::decode(const std::string& url) {
    nle::log::warn("FFmpegBufferDecoder: built without FFmpeg, cannot decode " + url);
    return DecodeResult{AudioError::Unsupported, nullptr, "FFmpeg support disabled"};
}

#endif

} // namespace nle::audio
