#include <catch2/catch_test_macros.hpp>
#include "audio/offline_audio_context.hpp"
#include "test_support.hpp"
#include <memory>

using namespace nle::audio;
using nle::test::approx;

namespace {
SourceRequest request_for(std::shared_ptr<const AudioBuffer> buffer, Seconds when, Seconds duration,
                          Seconds offset = 0.0) {
    SourceRequest req;
    req.buffer = std::move(buffer);
    req.when = when;
    req.offset = offset;
    req.duration = duration;
    req.clip_id = "clip";
    return req;
}
} // namespace

TEST_CASE("suspended context renders silence and keeps its clock", "[audio][context]") {
    OfflineAudioContext ctx;
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.5f));
    NodeId id = 0;
    REQUIRE(ctx.start_source(request_for(buf, 0.0, 1.0), id) == AudioError::None);
    REQUIRE(id != 0);

    auto out = ctx.render(480);
    REQUIRE(out.size() == 960);
    REQUIRE(approx(out[0], 0.0));
    REQUIRE(approx(ctx.current_time(), 0.0));

    REQUIRE(ctx.resume() == AudioError::None);
    out = ctx.render(480);
    REQUIRE(approx(out[0], 0.5, 1e-6));
    REQUIRE(approx(out[959], 0.5, 1e-6));
    REQUIRE(approx(ctx.current_time(), 0.01));
}

TEST_CASE("sources start at their scheduled time", "[audio][context]") {
    OfflineAudioContext ctx;
    ctx.resume();
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.5f));
    NodeId id = 0;
    ctx.start_source(request_for(buf, 0.02, 0.5), id);
    auto first = ctx.render(480);
    REQUIRE(approx(first[0], 0.0));
    REQUIRE(approx(first[958], 0.0));
    ctx.render(480);
    auto third = ctx.render(480);
    REQUIRE(approx(third[0], 0.5, 1e-6));
}

TEST_CASE("finished sources are dropped", "[audio][context]") {
    OfflineAudioContext ctx;
    ctx.resume();
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.5f));
    NodeId id = 0;
    ctx.start_source(request_for(buf, 0.0, 0.01), id);
    REQUIRE(ctx.active_source_count() == 1);
    ctx.render(480);
    REQUIRE(ctx.active_source_count() == 0);
    REQUIRE(ctx.stop_source(id) == AudioError::UnknownNode);
    REQUIRE(ctx.total_started() == 1);
}

TEST_CASE("master gain and envelopes scale the output", "[audio][context]") {
    OfflineAudioContext ctx(48000, 2);
    ctx.resume();
    ctx.set_master_gain(0.5f);
    REQUIRE(approx(ctx.master_gain(), 0.5));

    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 1.0f, 48000, 1));
    auto req = request_for(buf, 0.0, 1.0);
    req.envelope.set_value_at(0.0f, 0.0);
    req.envelope.linear_ramp_to(1.0f, 0.01);
    NodeId id = 0;
    ctx.start_source(std::move(req), id);
    auto out = ctx.render(480);
    // mono feeds both channels
    REQUIRE(approx(out[240 * 2], 0.25, 1e-3));
    REQUIRE(approx(out[240 * 2 + 1], 0.25, 1e-3));
    auto later = ctx.render(480);
    REQUIRE(approx(later[0], 0.5, 1e-6));
}

TEST_CASE("buffers at another rate are resampled", "[audio][context]") {
    OfflineAudioContext ctx(48000, 2);
    ctx.resume();
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.3f, 24000, 2));
    NodeId id = 0;
    ctx.start_source(request_for(buf, 0.0, 0.5, 0.25), id);
    auto out = ctx.render(4800);
    REQUIRE(approx(out[0], 0.3, 1e-6));
    REQUIRE(approx(out[9599], 0.3, 1e-6));
}

TEST_CASE("stop_source removes a live node", "[audio][context]") {
    OfflineAudioContext ctx;
    ctx.resume();
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.5f));
    NodeId id = 0;
    ctx.start_source(request_for(buf, 0.0, 1.0), id);
    REQUIRE(ctx.sources().size() == 1);
    REQUIRE(ctx.sources()[0].clip_id == "clip");
    REQUIRE(ctx.stop_source(id) == AudioError::None);
    REQUIRE(ctx.active_source_count() == 0);
    REQUIRE(ctx.total_stopped() == 1);
    auto out = ctx.render(480);
    REQUIRE(approx(out[0], 0.0));
}

TEST_CASE("bad requests are rejected", "[audio][context]") {
    OfflineAudioContext ctx;
    NodeId id = 0;
    REQUIRE(ctx.start_source(request_for(nullptr, 0.0, 1.0), id) == AudioError::InvalidArgument);
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.5f));
    REQUIRE(ctx.start_source(request_for(buf, 0.0, 0.0), id) == AudioError::InvalidArgument);
    REQUIRE(ctx.start_source(request_for(buf, 0.0, 1.0, -1.0), id) == AudioError::InvalidArgument);
    auto empty = std::make_shared<const AudioBuffer>();
    REQUIRE(ctx.start_source(request_for(empty, 0.0, 1.0), id) == AudioError::InvalidArgument);
}

TEST_CASE("a closed context refuses work", "[audio][context]") {
    OfflineAudioContext ctx;
    auto buf = std::make_shared<const AudioBuffer>(AudioBuffer::constant(1.0, 0.5f));
    NodeId id = 0;
    ctx.start_source(request_for(buf, 0.0, 1.0), id);
    REQUIRE(ctx.close() == AudioError::None);
    REQUIRE(ctx.is_closed());
    REQUIRE(ctx.active_source_count() == 0);
    REQUIRE(ctx.start_source(request_for(buf, 0.0, 1.0), id) == AudioError::ContextClosed);
    REQUIRE(ctx.resume() == AudioError::ContextClosed);
    std::vector<float> out(96);
    REQUIRE(ctx.render(out.data(), 48) == AudioError::ContextClosed);
    REQUIRE(ctx.close() == AudioError::None);
}
