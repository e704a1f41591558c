#include <catch2/catch_test_macros.hpp>
#include "timeline/edit_ops.hpp"
#include "test_support.hpp"

using namespace nle::timeline;
using nle::test::approx;
using nle::test::make_clip;
using nle::test::clip_in;
using nle::test::track_in;

namespace {
const TrackId V = "track-video-1";
const TrackId A = "track-audio-1";

ProjectState with_clips(std::initializer_list<Clip> clips) {
    ProjectState p = nle::test::base_project();
    for(const auto& c : clips) p = insert_clip(p, c);
    return p;
}
} // namespace

TEST_CASE("right trim without ripple shortens the clip", "[edit][trim]") {
    auto p = with_clips({make_clip("a", V, 0, 5)});
    auto next = trim_clip(p, "a", TrimSide::Right, 3.0, false);
    const auto& a = clip_in(next, "a");
    REQUIRE(approx(a.out_point, 3.0));
    REQUIRE(approx(a.end, 3.0));
    REQUIRE(approx(a.start, 0.0));
}

TEST_CASE("right trim clamps to the asset duration", "[edit][trim]") {
    auto p = with_clips({make_clip("a", V, 0, 5, 10.0)});
    auto next = trim_clip(p, "a", TrimSide::Right, 100.0, false);
    const auto& a = clip_in(next, "a");
    REQUIRE(approx(a.out_point, 60.0));
    REQUIRE(approx(a.end, 50.0));
}

TEST_CASE("left trim keeps the end unless rippling", "[edit][trim]") {
    auto p = with_clips({make_clip("a", V, 2, 7, 1.0)});

    auto plain = trim_clip(p, "a", TrimSide::Left, 3.0, false);
    REQUIRE(approx(clip_in(plain, "a").in_point, 3.0));
    REQUIRE(approx(clip_in(plain, "a").start, 4.0));
    REQUIRE(approx(clip_in(plain, "a").end, 7.0));

    auto rippled = trim_clip(p, "a", TrimSide::Left, 3.0, true);
    REQUIRE(approx(clip_in(rippled, "a").start, 2.0));
    REQUIRE(approx(clip_in(rippled, "a").end, 5.0));
}

TEST_CASE("non-rippled left trim never moves the start below zero", "[edit][trim]") {
    auto p = with_clips({make_clip("a", V, 1, 5, 2.0)});
    auto next = trim_clip(p, "a", TrimSide::Left, 0.0, false);
    const auto& a = clip_in(next, "a");
    REQUIRE(approx(a.start, 0.0));
    REQUIRE(approx(a.in_point, 1.0));
    REQUIRE(approx(a.end, 5.0));
}

TEST_CASE("trim keeps a minimum clip duration", "[edit][trim]") {
    auto p = with_clips({make_clip("a", V, 0, 5)});
    nle::core::EditorConfig cfg;
    auto next = trim_clip(p, "a", TrimSide::Right, -4.0, false, cfg);
    REQUIRE(approx(clip_in(next, "a").duration(), cfg.min_clip_duration));
}

TEST_CASE("ripple trim preserves downstream gaps", "[edit][trim][ripple]") {
    auto p = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 5, 8, 10.0), make_clip("c", V, 10, 12, 20.0)});
    auto next = trim_clip(p, "a", TrimSide::Right, 3.0, true);
    REQUIRE(approx(clip_in(next, "b").start, 3.0));
    REQUIRE(approx(clip_in(next, "c").start, 8.0));
    REQUIRE(approx(clip_in(next, "c").start - clip_in(next, "b").end, 2.0));
    REQUIRE(validate_project(next).ok);
}

TEST_CASE("moving a clip flush creates a default crossfade", "[edit][move][transition]") {
    auto p = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 6, 9, 10.0)});
    auto next = move_clip(p, "b", V, 5.0, false);
    const auto& a = clip_in(next, "a");
    REQUIRE(approx(clip_in(next, "b").start, 5.0));
    REQUIRE(a.transition.has_value());
    REQUIRE(a.transition->to_clip_id == "b");
    REQUIRE(approx(a.transition->duration, 0.5));
}

TEST_CASE("moving a clip apart drops its crossfade", "[edit][move][transition]") {
    auto p = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 5, 8, 10.0)});
    p = set_transition(p, "a", "b", 0.5);
    REQUIRE(clip_in(p, "a").transition.has_value());

    auto apart = move_clip(p, "b", V, 7.0, false);
    REQUIRE_FALSE(clip_in(apart, "a").transition.has_value());

    auto other_track = move_clip(p, "b", A, 5.0, false);
    REQUIRE_FALSE(clip_in(other_track, "a").transition.has_value());
    REQUIRE(clip_in(other_track, "b").track_id == A);
    REQUIRE(track_in(other_track, V).clips.size() == 1);
}

TEST_CASE("same-track ripple move shifts following clips", "[edit][move][ripple]") {
    auto p = with_clips({make_clip("a", V, 0, 2), make_clip("b", V, 2, 4, 10.0), make_clip("c", V, 6, 8, 20.0)});
    auto next = move_clip(p, "a", V, 1.0, true);
    REQUIRE(approx(clip_in(next, "a").start, 1.0));
    REQUIRE(approx(clip_in(next, "b").start, 3.0));
    REQUIRE(approx(clip_in(next, "c").start, 7.0));

    auto clamped = move_clip(p, "c", V, -3.0, false);
    REQUIRE(approx(clip_in(clamped, "c").start, 0.0));
}

TEST_CASE("ripple delete closes the gap", "[edit][delete][ripple]") {
    auto p = with_clips({make_clip("a", V, 2, 5), make_clip("b", V, 5, 8, 10.0)});
    auto next = remove_clip(p, "a", true);
    REQUIRE(find_clip(next.tracks, "a") == nullptr);
    REQUIRE(approx(clip_in(next, "b").start, 2.0));
    REQUIRE(approx(clip_in(next, "b").end, 5.0));

    auto kept = remove_clip(p, "a", false);
    REQUIRE(approx(clip_in(kept, "b").start, 5.0));
}

TEST_CASE("group delete is one state change", "[edit][delete]") {
    auto p = with_clips({make_clip("a", V, 0, 2), make_clip("b", V, 2, 4, 10.0), make_clip("c", V, 4, 6, 20.0)});
    auto next = remove_clips(p, {"a", "c", "missing"}, true);
    REQUIRE(track_in(next, V).clips.size() == 1);
    REQUIRE(approx(clip_in(next, "b").start, 0.0));

    REQUIRE(remove_clips(p, {"missing"}) == p);
}

TEST_CASE("split preserves total duration and source continuity", "[edit][split]") {
    auto p = with_clips({make_clip("a", V, 2, 7, 1.0)});
    auto next = split_clip(p, "a", 4.0, "a-split-1");
    const auto& left = clip_in(next, "a");
    const auto& right = clip_in(next, "a-split-1");
    REQUIRE(approx(left.end, 4.0));
    REQUIRE(approx(left.out_point, 3.0));
    REQUIRE(approx(right.start, 4.0));
    REQUIRE(approx(right.in_point, 3.0));
    REQUIRE(approx(right.out_point, 6.0));
    REQUIRE(approx(left.duration() + right.duration(), 5.0));
    REQUIRE(right.asset_id == left.asset_id);
}

TEST_CASE("split outside the clip or onto a taken id is a no-op", "[edit][split]") {
    auto p = with_clips({make_clip("a", V, 2, 7), make_clip("b", V, 8, 9, 10.0)});
    REQUIRE(split_clip(p, "a", 2.0, "x") == p);
    REQUIRE(split_clip(p, "a", 7.0, "x") == p);
    REQUIRE(split_clip(p, "a", 4.0, "b") == p);
}

TEST_CASE("locked tracks reject clip edits", "[edit][locked]") {
    auto p = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 6, 9, 10.0)});
    p = set_track_locked(p, V, true);
    REQUIRE(track_in(p, V).locked);
    REQUIRE(trim_clip(p, "a", TrimSide::Right, 3.0, true) == p);
    REQUIRE(move_clip(p, "b", V, 5.0, false) == p);
    REQUIRE(split_clip(p, "a", 2.0, "a-2") == p);
    REQUIRE(remove_clip(p, "a") == p);
    REQUIRE(insert_clip(p, make_clip("c", V, 20, 21)) == p);
}

TEST_CASE("unknown ids leave the state unchanged", "[edit]") {
    auto p = with_clips({make_clip("a", V, 0, 5)});
    REQUIRE(trim_clip(p, "zzz", TrimSide::Left, 1.0, false) == p);
    REQUIRE(move_clip(p, "a", "track-nope", 1.0, false) == p);
    REQUIRE(remove_transition(p, "a") == p);
}

TEST_CASE("insert clamps the timeline span to the source", "[edit][insert]") {
    auto p = nle::test::base_project();
    auto clip = make_clip("a", V, 1, 10, 0.0, 4.0);
    auto next = insert_clip(p, clip);
    REQUIRE(approx(clip_in(next, "a").end, 5.0));
    REQUIRE(insert_clip(next, make_clip("a", V, 20, 21)) == next);
    REQUIRE(insert_clip(next, make_clip("z", V, 3, 3)) == next);
}

TEST_CASE("set_transition clamps and keeps one incoming fade", "[edit][transition]") {
    auto p = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 5, 8, 10.0)});
    auto next = set_transition(p, "a", "b", 5.0);
    REQUIRE(approx(clip_in(next, "a").transition->duration, 1.5));
    next = set_transition(next, "a", "b", 0.1);
    REQUIRE(approx(clip_in(next, "a").transition->duration, 0.25));

    auto gap = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 6, 8, 10.0)});
    REQUIRE(set_transition(gap, "a", "b", 0.5) == gap);

    auto removed = remove_transition(next, "a");
    REQUIRE_FALSE(clip_in(removed, "a").transition.has_value());
}

TEST_CASE("reconcile drops dangling transitions", "[edit][transition]") {
    auto p = with_clips({make_clip("a", V, 0, 5), make_clip("b", V, 5, 8, 10.0)});
    p = set_transition(p, "a", "b", 0.5);
    // bypass the edit engine to leave a dangling reference behind
    auto& clips = p.tracks[0].clips;
    clips.erase(clips.begin() + 1);
    REQUIRE(clip_in(p, "a").transition.has_value());
    reconcile_transitions(p);
    REQUIRE_FALSE(clip_in(p, "a").transition.has_value());
}

TEST_CASE("caption patch updates only the given fields", "[edit][caption]") {
    auto p = nle::test::base_project();
    auto cap = make_clip("cap", "track-overlay-1", 0, 3, 0.0, std::nullopt, std::nullopt);
    cap.caption = Caption{};
    cap.caption->text = "Hello";
    p = insert_clip(p, cap);

    CaptionPatch patch;
    patch.text = "World";
    patch.opacity = 2.0;
    auto next = update_caption(p, "cap", patch);
    const auto& c = *clip_in(next, "cap").caption;
    REQUIRE(c.text == "World");
    REQUIRE(approx(c.opacity, 1.0));
    REQUIRE(approx(c.font_size, 48.0));
    REQUIRE(update_caption(next, "cap", CaptionPatch{}) == next);
}

TEST_CASE("asset operations never touch clips", "[edit][asset]") {
    auto p = with_clips({make_clip("a", V, 0, 5)});
    auto next = remove_asset(p, "asset-1");
    REQUIRE(next.assets.empty());
    REQUIRE(clip_in(next, "a").asset_id == std::optional<std::string>("asset-1"));

    auto added = add_asset(next, nle::test::make_asset("asset-2", AssetKind::Audio, 12.0));
    REQUIRE(find_asset(added, "asset-2"));
    REQUIRE(add_asset(added, nle::test::make_asset("asset-2", AssetKind::Audio, 12.0)) == added);

    AssetMetadataPatch meta;
    meta.width = 1920;
    meta.extra["codec"] = "h264";
    auto patched = attach_asset_metadata(added, "asset-2", meta);
    REQUIRE(find_asset(patched, "asset-2")->metadata.width == 1920);
    REQUIRE(find_asset(patched, "asset-2")->metadata.extra.at("codec") == "h264");
    REQUIRE(attach_asset_metadata(added, "missing", meta) == added);
}

TEST_CASE("project level toggles", "[edit]") {
    auto p = nle::test::base_project();
    REQUIRE(set_aspect_ratio(p, "16:9") == p);
    REQUIRE(set_aspect_ratio(p, "9:16").aspect_ratio == "9:16");
    REQUIRE(track_in(set_track_muted(p, A, true), A).muted);
    REQUIRE(set_track_muted(p, A, false) == p);
}
